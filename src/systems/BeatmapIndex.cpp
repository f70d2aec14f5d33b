#include "BeatmapIndex.h"

bool BeatmapSet::operator==(const BeatmapSet& other) const {
    return beatmapSetId == other.beatmapSetId &&
           folderPath == other.folderPath &&
           fingerprint == other.fingerprint &&
           charts == other.charts;
}

void BeatmapIndex::upsert(BeatmapSet set) {
    std::string key = set.folderPath;
    bySet[key] = std::move(set);
    rebuildSetIdView();
}

void BeatmapIndex::replaceAll(SetMap sets) {
    bySet = std::move(sets);
    rebuildSetIdView();
}

void BeatmapIndex::clear() {
    bySet.clear();
    bySetId.clear();
}

const BeatmapSet* BeatmapIndex::find(const std::string& folderPath) const {
    auto it = bySet.find(folderPath);
    return it == bySet.end() ? nullptr : &it->second;
}

const std::vector<std::string>& BeatmapIndex::foldersWithSetId(int64_t beatmapSetId) const {
    static const std::vector<std::string> none;
    auto it = bySetId.find(beatmapSetId);
    return it == bySetId.end() ? none : it->second;
}

bool BeatmapIndex::operator==(const BeatmapIndex& other) const {
    return rootPath == other.rootPath && bySet == other.bySet;
}

void BeatmapIndex::rebuildSetIdView() {
    bySetId.clear();
    // bySet is ordered, so each list comes out in path order
    for (const auto& [path, set] : bySet) {
        if (set.beatmapSetId != 0) {
            bySetId[set.beatmapSetId].push_back(path);
        }
    }
}
