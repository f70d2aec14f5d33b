#pragma once
#include <string>
#include "BeatmapIndex.h"

enum class CacheLoad {
    Loaded,
    Missing,
    Corrupt   // Unreadable or from another format version; treat as Missing
};

// Persisted mirror of the index
class CacheStore {
public:
    virtual ~CacheStore() = default;

    // On anything but Loaded the index is left empty
    virtual CacheLoad load(BeatmapIndex& index) = 0;
    virtual bool save(const BeatmapIndex& index) = 0;
    // Drop the persisted state
    virtual void invalidate() = 0;
};

// Keeps the encoded index in memory (tests, read-only data directories)
class MemoryCacheStore : public CacheStore {
public:
    CacheLoad load(BeatmapIndex& index) override;
    bool save(const BeatmapIndex& index) override;
    void invalidate() override;

    const std::string& blob() const { return data; }
    void setBlob(const std::string& blob) { data = blob; hasData = true; }

private:
    std::string data;
    bool hasData = false;
};
