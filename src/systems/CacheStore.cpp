#include "CacheStore.h"
#include "SongIndex.h"

CacheLoad MemoryCacheStore::load(BeatmapIndex& index) {
    index.clear();
    index.setRootPath("");
    if (!hasData) return CacheLoad::Missing;
    if (!SongIndex::decode(data, index)) {
        index.clear();
        index.setRootPath("");
        return CacheLoad::Corrupt;
    }
    return CacheLoad::Loaded;
}

bool MemoryCacheStore::save(const BeatmapIndex& index) {
    data = SongIndex::encode(index);
    hasData = true;
    return true;
}

void MemoryCacheStore::invalidate() {
    data.clear();
    hasData = false;
}
