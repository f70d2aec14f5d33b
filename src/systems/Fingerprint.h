#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One regular file directly inside a beatmapset folder
struct FolderEntry {
    std::string name;
    uint64_t size = 0;
    int64_t lastModified = 0;  // File clock ticks
};

class Fingerprint {
public:
    // Lists the regular files of a folder (non-recursive), sorted by name.
    // Returns false with a message if the folder cannot be read.
    static bool listFolder(const std::string& folderPath, std::vector<FolderEntry>& entries,
                           std::string& errorMessage);

    // MD5 over the folder path and its file listing
    static std::string compute(const std::string& folderPath, const std::vector<FolderEntry>& entries);
};
