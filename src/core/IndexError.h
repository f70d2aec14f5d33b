#pragma once
#include <string>

enum class ErrorKind {
    ParseError,       // One chart file unreadable or malformed
    ScanWarning,      // One folder skipped during a scan
    CacheCorrupt,     // Persisted index unreadable, rebuilt instead
    QueryError,       // Malformed query or unknown field qualifier
    RootPathInvalid   // Songs root missing or not a directory
};

struct IndexError {
    ErrorKind kind = ErrorKind::ParseError;
    std::string path;     // File or folder concerned, may be empty
    std::string message;
};

const char* errorKindName(ErrorKind kind);
