#include "Fingerprint.h"
#include "../core/MD5.h"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

bool Fingerprint::listFolder(const std::string& folderPath, std::vector<FolderEntry>& entries,
                             std::string& errorMessage) {
    entries.clear();

    std::error_code ec;
    fs::directory_iterator it(folderPath, ec);
    if (ec) {
        errorMessage = ec.message();
        return false;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;

        std::error_code entryEc;
        if (!it->is_regular_file(entryEc) || entryEc) continue;

        FolderEntry entry;
        entry.name = it->path().filename().string();
        entry.size = it->file_size(entryEc);
        if (entryEc) entry.size = 0;
        auto ftime = it->last_write_time(entryEc);
        if (!entryEc) {
            entry.lastModified = (int64_t)ftime.time_since_epoch().count();
        }
        entries.push_back(std::move(entry));
    }

    if (ec) {
        // Folder vanished or became unreadable mid-listing
        errorMessage = ec.message();
        entries.clear();
        return false;
    }

    std::sort(entries.begin(), entries.end(),
        [](const FolderEntry& a, const FolderEntry& b) { return a.name < b.name; });
    return true;
}

std::string Fingerprint::compute(const std::string& folderPath, const std::vector<FolderEntry>& entries) {
    MD5 md5;
    md5.updateField(folderPath);
    md5.updateField((int64_t)entries.size());
    for (const auto& entry : entries) {
        md5.updateField(entry.name);
        md5.updateField((int64_t)entry.size);
        md5.updateField(entry.lastModified);
    }
    return md5.hexdigest();
}
