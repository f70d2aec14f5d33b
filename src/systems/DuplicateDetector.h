#pragma once
#include <string>
#include <vector>
#include "BeatmapIndex.h"

enum class DuplicateRule {
    SetId,            // Same nonzero beatmapSetId
    ContentSignature  // Unsubmitted sets with identical title/artist/creator and chart count
};

struct DuplicateGroup {
    DuplicateRule rule = DuplicateRule::SetId;
    std::vector<const BeatmapSet*> sets;  // Ordered by folder path, at least two
};

class DuplicateDetector {
public:
    // Groups are ordered by size (largest first), then by first folder path.
    // Pointers refer into index and stay valid until it is modified.
    static std::vector<DuplicateGroup> findDuplicates(const BeatmapIndex& index);

    // Identity used for sets without a beatmapSetId
    static std::string contentSignature(const BeatmapSet& set);
};
