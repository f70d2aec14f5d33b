#include "IndexError.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:      return "ParseError";
        case ErrorKind::ScanWarning:     return "ScanWarning";
        case ErrorKind::CacheCorrupt:    return "CacheCorrupt";
        case ErrorKind::QueryError:      return "QueryError";
        case ErrorKind::RootPathInvalid: return "RootPathInvalid";
    }
    return "Unknown";
}
