#include "DuplicateDetector.h"
#include "../core/TextUtils.h"
#include <algorithm>
#include <map>
#include <SDL3/SDL.h>

namespace {

// Separators that cannot appear in folded metadata
const char FIELD_SEPARATOR = '\x1f';
const char TUPLE_SEPARATOR = '\x1e';

} // anonymous namespace

std::string DuplicateDetector::contentSignature(const BeatmapSet& set) {
    std::vector<std::string> tuples;
    tuples.reserve(set.charts.size());
    for (const auto& chart : set.charts) {
        tuples.push_back(TextUtils::normalizeKey(chart.title) + FIELD_SEPARATOR +
                         TextUtils::normalizeKey(chart.artist) + FIELD_SEPARATOR +
                         TextUtils::normalizeKey(chart.creator));
    }
    std::sort(tuples.begin(), tuples.end());
    tuples.erase(std::unique(tuples.begin(), tuples.end()), tuples.end());

    std::string signature = std::to_string(set.charts.size());
    for (const auto& tuple : tuples) {
        signature += TUPLE_SEPARATOR;
        signature += tuple;
    }
    return signature;
}

std::vector<DuplicateGroup> DuplicateDetector::findDuplicates(const BeatmapIndex& index) {
    std::vector<DuplicateGroup> groups;
    std::map<std::string, std::vector<const BeatmapSet*>> bySignature;

    // Index iteration is in path order, so every member list comes out sorted
    for (const auto& [path, set] : index.sets()) {
        if (set.charts.empty()) continue;

        if (set.beatmapSetId == 0) {
            bySignature[contentSignature(set)].push_back(&set);
            continue;
        }

        const auto& folders = index.foldersWithSetId(set.beatmapSetId);
        if (folders.size() < 2) continue;

        DuplicateGroup group{DuplicateRule::SetId, {}};
        for (const auto& folder : folders) {
            const BeatmapSet* member = index.find(folder);
            if (member && !member->charts.empty()) group.sets.push_back(member);
        }
        // Emit each group once, from its first member
        if (group.sets.size() >= 2 && group.sets.front() == &set) {
            groups.push_back(std::move(group));
        }
    }

    for (auto& [signature, sets] : bySignature) {
        if (sets.size() >= 2) groups.push_back({DuplicateRule::ContentSignature, std::move(sets)});
    }

    std::sort(groups.begin(), groups.end(), [](const DuplicateGroup& a, const DuplicateGroup& b) {
        if (a.sets.size() != b.sets.size()) return a.sets.size() > b.sets.size();
        return a.sets.front()->folderPath < b.sets.front()->folderPath;
    });

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[CHECK] %d duplicate groups in %d sets",
                 (int)groups.size(), (int)index.size());
    return groups;
}
