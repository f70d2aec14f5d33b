#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "../parsers/OsuParser.h"

// All difficulties found in one beatmapset folder
struct BeatmapSet {
    int64_t beatmapSetId = 0;   // 0 = unsubmitted
    std::string folderPath;
    std::string fingerprint;    // See Fingerprint::compute
    std::vector<ChartRecord> charts;  // Ordered by file name

    bool operator==(const BeatmapSet& other) const;
    bool operator!=(const BeatmapSet& other) const { return !(*this == other); }
};

// In-memory index keyed by folder path, iterated in path order
class BeatmapIndex {
public:
    using SetMap = std::map<std::string, BeatmapSet>;

    const std::string& getRootPath() const { return rootPath; }
    void setRootPath(const std::string& path) { rootPath = path; }

    // Insert or replace the set stored under set.folderPath
    void upsert(BeatmapSet set);
    // Replace every set at once, rebuilding the id view a single time
    void replaceAll(SetMap sets);
    void clear();

    const BeatmapSet* find(const std::string& folderPath) const;
    const SetMap& sets() const { return bySet; }
    size_t size() const { return bySet.size(); }
    bool empty() const { return bySet.empty(); }

    // Folder paths sharing a nonzero beatmapSetId, in path order
    const std::vector<std::string>& foldersWithSetId(int64_t beatmapSetId) const;

    bool operator==(const BeatmapIndex& other) const;

private:
    void rebuildSetIdView();

    std::string rootPath;
    SetMap bySet;
    std::unordered_map<int64_t, std::vector<std::string>> bySetId;  // Derived, never persisted
};
