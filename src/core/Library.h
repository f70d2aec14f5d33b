#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "IndexError.h"
#include "../systems/BeatmapIndex.h"
#include "../systems/CacheStore.h"
#include "../systems/DuplicateDetector.h"
#include "../systems/QueryEngine.h"
#include "../systems/SetScanner.h"

// One session over a songs folder: owns the index and its cache store.
// Every operation that changes the index persists it afterwards.
class Library {
public:
    explicit Library(std::unique_ptr<CacheStore> store, ScanOptions options = ScanOptions());

    // Loads the cache and refreshes it against rootPath. A cache that is
    // missing, corrupt or built for another root is rebuilt from scratch.
    bool open(const std::string& rootPath, IndexError& error);

    // Re-parses only folders whose fingerprint changed
    bool refresh(IndexError& error);

    // Drops the persisted and in-memory index and rebuilds it
    bool flush(IndexError& error);

    // Points the session at another songs folder and rebuilds
    bool changeRoot(const std::string& rootPath, IndexError& error);

    QueryResults list() const;
    std::optional<QueryResults> find(const std::string& queryText, IndexError& error) const;
    std::vector<DuplicateGroup> check() const;

    const BeatmapIndex& getIndex() const { return index; }
    const std::string& getRootPath() const { return rootPath; }
    const ScanSummary& getLastScan() const { return lastScan; }
    CacheLoad getLastCacheLoad() const { return lastCacheLoad; }

private:
    bool rescan(bool reuseCached, IndexError& error);
    void persist();

    std::unique_ptr<CacheStore> store;
    ScanOptions scanOptions;
    BeatmapIndex index;
    std::string rootPath;
    ScanSummary lastScan;
    CacheLoad lastCacheLoad = CacheLoad::Missing;
};
