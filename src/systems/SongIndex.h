#pragma once
#include <iosfwd>
#include <string>
#include "CacheStore.h"

// Index file version (increment when format changes)
constexpr int INDEX_VERSION = 7;

// File-backed cache store, one binary file for the whole index
class SongIndex : public CacheStore {
public:
    explicit SongIndex(std::string indexPath);

    CacheLoad load(BeatmapIndex& index) override;
    bool save(const BeatmapIndex& index) override;
    void invalidate() override;

    // Binary form shared by every store
    static std::string encode(const BeatmapIndex& index);
    static bool decode(const std::string& blob, BeatmapIndex& index);

private:
    static void writeString(std::ostream& f, const std::string& s);
    static bool readString(std::istream& f, std::string& s);
    static void writeInt(std::ostream& f, int64_t value);
    static bool readInt(std::istream& f, int64_t& value);

    std::string indexPath;
};
