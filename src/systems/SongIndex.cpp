#include "SongIndex.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <SDL3/SDL.h>

namespace fs = std::filesystem;

namespace {

const char INDEX_MAGIC[4] = {'B', 'M', 'L', 'X'};

// Upper bound for one stored string; anything larger means a corrupt file
const uint32_t MAX_STRING_LENGTH = 16u * 1024u * 1024u;

// Smallest encoded size of each record: every string empty, 8 bytes per field
const int64_t MIN_SET_BYTES = 4 * 8;
const int64_t MIN_CHART_BYTES = 13 * 8;
const int64_t MIN_EXTRA_BYTES = 2 * 8;

} // anonymous namespace

SongIndex::SongIndex(std::string indexPath) : indexPath(std::move(indexPath)) {}

void SongIndex::writeInt(std::ostream& f, int64_t value) {
    char bytes[8];
    for (int i = 0; i < 8; i++) {
        bytes[i] = (char)(uint8_t)((uint64_t)value >> (i * 8));
    }
    f.write(bytes, sizeof(bytes));
}

bool SongIndex::readInt(std::istream& f, int64_t& value) {
    char bytes[8];
    if (!f.read(bytes, sizeof(bytes))) return false;
    uint64_t v = 0;
    for (int i = 0; i < 8; i++) {
        v |= (uint64_t)(uint8_t)bytes[i] << (i * 8);
    }
    value = (int64_t)v;
    return true;
}

void SongIndex::writeString(std::ostream& f, const std::string& s) {
    writeInt(f, (int64_t)s.size());
    if (!s.empty()) {
        f.write(s.data(), (std::streamsize)s.size());
    }
}

bool SongIndex::readString(std::istream& f, std::string& s) {
    int64_t len = 0;
    if (!readInt(f, len)) return false;
    if (len < 0 || len > MAX_STRING_LENGTH) return false;
    s.assign((size_t)len, '\0');
    if (len > 0 && !f.read(&s[0], len)) return false;
    return true;
}

std::string SongIndex::encode(const BeatmapIndex& index) {
    std::ostringstream f(std::ios::binary);
    f.write(INDEX_MAGIC, sizeof(INDEX_MAGIC));
    writeInt(f, INDEX_VERSION);
    writeString(f, index.getRootPath());

    writeInt(f, (int64_t)index.size());
    for (const auto& [path, set] : index.sets()) {
        writeString(f, set.folderPath);
        writeInt(f, set.beatmapSetId);
        writeString(f, set.fingerprint);

        writeInt(f, (int64_t)set.charts.size());
        for (const auto& chart : set.charts) {
            writeString(f, chart.filePath);
            writeString(f, chart.folderPath);
            writeString(f, chart.hash);
            writeInt(f, chart.beatmapId);
            writeInt(f, chart.beatmapSetId);
            writeString(f, chart.title);
            writeString(f, chart.artist);
            writeString(f, chart.creator);
            writeString(f, chart.difficultyName);
            writeString(f, chart.audioFileName);
            writeInt(f, chart.mode);
            writeInt(f, chart.formatVersion);

            writeInt(f, (int64_t)chart.extra.size());
            for (const auto& [key, value] : chart.extra) {
                writeString(f, key);
                writeString(f, value);
            }
        }
    }
    return f.str();
}

bool SongIndex::decode(const std::string& blob, BeatmapIndex& index) {
    std::istringstream f(blob, std::ios::binary);
    // A count can never promise more records than the bytes left could hold
    auto fits = [&](int64_t count, int64_t minBytes) {
        std::streamoff pos = f.tellg();
        if (count < 0 || pos < 0) return false;
        return count <= ((int64_t)blob.size() - (int64_t)pos) / minBytes;
    };

    char magic[sizeof(INDEX_MAGIC)];
    if (!f.read(magic, sizeof(magic))) return false;
    if (!std::equal(std::begin(magic), std::end(magic), std::begin(INDEX_MAGIC))) return false;

    int64_t version = 0;
    if (!readInt(f, version) || version != INDEX_VERSION) return false;

    std::string rootPath;
    if (!readString(f, rootPath)) return false;

    int64_t setCount = 0;
    if (!readInt(f, setCount) || !fits(setCount, MIN_SET_BYTES)) return false;

    BeatmapIndex::SetMap sets;
    for (int64_t i = 0; i < setCount; i++) {
        BeatmapSet set;
        int64_t chartCount = 0;
        if (!readString(f, set.folderPath) ||
            !readInt(f, set.beatmapSetId) ||
            !readString(f, set.fingerprint) ||
            !readInt(f, chartCount)) {
            return false;
        }
        if (!fits(chartCount, MIN_CHART_BYTES)) return false;

        set.charts.reserve((size_t)chartCount);
        for (int64_t c = 0; c < chartCount; c++) {
            ChartRecord chart;
            int64_t mode = 0;
            int64_t formatVersion = 0;
            int64_t extraCount = 0;
            if (!readString(f, chart.filePath) ||
                !readString(f, chart.folderPath) ||
                !readString(f, chart.hash) ||
                !readInt(f, chart.beatmapId) ||
                !readInt(f, chart.beatmapSetId) ||
                !readString(f, chart.title) ||
                !readString(f, chart.artist) ||
                !readString(f, chart.creator) ||
                !readString(f, chart.difficultyName) ||
                !readString(f, chart.audioFileName) ||
                !readInt(f, mode) ||
                !readInt(f, formatVersion) ||
                !readInt(f, extraCount)) {
                return false;
            }
            if (!fits(extraCount, MIN_EXTRA_BYTES)) return false;
            chart.mode = (int)mode;
            chart.formatVersion = (int)formatVersion;

            for (int64_t e = 0; e < extraCount; e++) {
                std::string key, value;
                if (!readString(f, key) || !readString(f, value)) return false;
                chart.extra[key] = value;
            }
            set.charts.push_back(std::move(chart));
        }

        std::string key = set.folderPath;
        if (!sets.emplace(key, std::move(set)).second) return false;  // Duplicate folder key
    }

    // Trailing bytes mean the file was not written by this version
    if (f.peek() != std::char_traits<char>::eof()) return false;

    index.setRootPath(rootPath);
    index.replaceAll(std::move(sets));
    return true;
}

CacheLoad SongIndex::load(BeatmapIndex& index) {
    index.clear();
    index.setRootPath("");

    std::error_code ec;
    if (!fs::exists(indexPath, ec)) return CacheLoad::Missing;

    std::ifstream f(indexPath, std::ios::binary);
    if (!f) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Cannot open %s", indexPath.c_str());
        return CacheLoad::Corrupt;
    }

    std::string blob((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!decode(blob, index)) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                    "[CACHE] %s is corrupt or from another version, rebuilding", indexPath.c_str());
        index.clear();
        index.setRootPath("");
        return CacheLoad::Corrupt;
    }

    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Loaded %d sets from %s",
                 (int)index.size(), indexPath.c_str());
    return CacheLoad::Loaded;
}

bool SongIndex::save(const BeatmapIndex& index) {
    std::error_code ec;
    fs::path target(indexPath);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Cannot create %s: %s",
                         target.parent_path().string().c_str(), ec.message().c_str());
            return false;
        }
    }

    // Write temp then rename
    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Cannot write %s", tmp.string().c_str());
            return false;
        }
        std::string blob = encode(index);
        f.write(blob.data(), (std::streamsize)blob.size());
        if (!f.good()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Write failed for %s", tmp.string().c_str());
            return false;
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(target, ec);
        fs::rename(tmp, target, ec);
    }
    if (ec) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Cannot replace %s: %s",
                     indexPath.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

void SongIndex::invalidate() {
    std::error_code ec;
    fs::remove(indexPath, ec);
    if (ec) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[CACHE] Cannot remove %s: %s",
                    indexPath.c_str(), ec.message().c_str());
    }
}
