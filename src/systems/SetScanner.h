#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>
#include "BeatmapIndex.h"
#include "../core/IndexError.h"

struct ScanSummary {
    int foldersSeen = 0;
    int setsIndexed = 0;
    int setsReused = 0;      // Fingerprint unchanged, taken from the previous index
    int chartsParsed = 0;    // Extractor invocations
    int emptyFolders = 0;    // No chart files at all
    int skippedFolders = 0;  // Unreadable, or no chart parsed
    std::vector<IndexError> warnings;  // ParseError and ScanWarning entries
};

struct ScanOptions {
    int threads = 0;  // 0 = hardware concurrency
    // Called on the scanning thread after each folder: done, total, folder name
    std::function<void(int, int, const std::string&)> progress;
    // Set from another thread to stop between folders
    const std::atomic<bool>* cancel = nullptr;
};

class SetScanner {
public:
    // Scans every immediate subfolder of rootPath. Folders whose fingerprint
    // matches the entry in previous are reused without parsing. On success
    // result holds the new index; on RootPathInvalid or cancellation it is
    // left untouched and false is returned.
    static bool scan(const std::string& rootPath, const BeatmapIndex& previous,
                     const ScanOptions& options, BeatmapIndex& result,
                     ScanSummary& summary, IndexError& error);

    // Leading number of "<sid> <artist> - <title>", 0 if the name has none
    static int64_t setIdFromFolderName(const std::string& folderName);

private:
    struct FolderJob;

    static bool collectFolders(const std::string& rootPath, std::vector<std::string>& folders,
                               IndexError& error);
    static void processFolder(FolderJob& job, const BeatmapIndex& previous);
};
