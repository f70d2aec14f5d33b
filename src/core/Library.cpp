#include "Library.h"
#include <SDL3/SDL.h>

Library::Library(std::unique_ptr<CacheStore> store, ScanOptions options)
    : store(std::move(store)), scanOptions(std::move(options)) {}

bool Library::open(const std::string& root, IndexError& error) {
    rootPath = root;

    lastCacheLoad = store->load(index);
    bool reuse = false;
    switch (lastCacheLoad) {
        case CacheLoad::Loaded:
            if (index.getRootPath() == rootPath) {
                reuse = true;
            } else {
                SDL_Log("[CACHE] Index was built for %s, rebuilding", index.getRootPath().c_str());
            }
            break;
        case CacheLoad::Corrupt:
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] %s: index unreadable, rebuilding",
                        errorKindName(ErrorKind::CacheCorrupt));
            break;
        case CacheLoad::Missing:
            SDL_Log("[CACHE] No index yet, scanning %s", rootPath.c_str());
            break;
    }

    if (!reuse) {
        index.clear();
        index.setRootPath(rootPath);
    }
    return rescan(reuse, error);
}

bool Library::refresh(IndexError& error) {
    return rescan(true, error);
}

bool Library::flush(IndexError& error) {
    store->invalidate();
    index.clear();
    index.setRootPath(rootPath);
    return rescan(false, error);
}

bool Library::changeRoot(const std::string& root, IndexError& error) {
    rootPath = root;
    return flush(error);
}

bool Library::rescan(bool reuseCached, IndexError& error) {
    BeatmapIndex empty;
    const BeatmapIndex& previous = reuseCached ? index : empty;

    BeatmapIndex scanned;
    ScanSummary summary;
    if (!SetScanner::scan(rootPath, previous, scanOptions, scanned, summary, error)) {
        // Keep whatever index we had; it is still useful for browsing
        return false;
    }

    index = std::move(scanned);
    lastScan = std::move(summary);
    persist();
    return true;
}

void Library::persist() {
    if (!store->save(index)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Index not saved, next start will rescan");
    }
}

QueryResults Library::list() const {
    return QueryEngine::run(index, Query());
}

std::optional<QueryResults> Library::find(const std::string& queryText, IndexError& error) const {
    Query query;
    if (!QueryEngine::parse(queryText, query, error)) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[QUERY] Rejected '%s': %s",
                     queryText.c_str(), error.message.c_str());
        return std::nullopt;
    }
    return QueryEngine::run(index, query);
}

std::vector<DuplicateGroup> Library::check() const {
    return DuplicateDetector::findDuplicates(index);
}
