#include "OsuParser.h"
#include "../core/MD5.h"
#include "../core/TextUtils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <vector>
#include <SDL3/SDL.h>

namespace fs = std::filesystem;

using TextUtils::trim;

namespace {

const char* FORMAT_HEADER = "osu file format v";

// Key-value sections in the order the game writes them
const char* KEY_VALUE_SECTIONS[] = {"General", "Editor", "Metadata", "Difficulty", "Colours"};

// Values that do not fit an int fall back to the default
int parseSmallIntOr(const std::string& value, int defaultValue) {
    int64_t parsed = TextUtils::parseIntOr(value, defaultValue);
    if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
        return defaultValue;
    }
    return static_cast<int>(parsed);
}

void writeExtras(std::ostringstream& out, const ChartRecord& chart, const std::string& section) {
    std::string prefix = section + ".";
    for (const auto& [key, value] : chart.extra) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            out << key.substr(prefix.size()) << ":" << value << "\n";
        }
    }
}

} // anonymous namespace

bool ChartRecord::operator==(const ChartRecord& other) const {
    return beatmapId == other.beatmapId &&
           beatmapSetId == other.beatmapSetId &&
           title == other.title &&
           artist == other.artist &&
           creator == other.creator &&
           difficultyName == other.difficultyName &&
           audioFileName == other.audioFileName &&
           mode == other.mode &&
           formatVersion == other.formatVersion &&
           filePath == other.filePath &&
           folderPath == other.folderPath &&
           hash == other.hash &&
           extra == other.extra;
}

bool OsuParser::isChartFile(const std::string& filename) {
    std::string ext = TextUtils::toLowerAscii(fs::path(filename).extension().string());
    return ext == ".osu";
}

bool OsuParser::isKeyValueSection(const std::string& section) {
    return std::find(std::begin(KEY_VALUE_SECTIONS), std::end(KEY_VALUE_SECTIONS), section) !=
           std::end(KEY_VALUE_SECTIONS);
}

void OsuParser::applyField(const std::string& section, const std::string& key,
                           const std::string& value, ChartRecord& chart) {
    if (section == "General") {
        if (key == "AudioFilename") { chart.audioFileName = value; return; }
        if (key == "Mode") { chart.mode = parseSmallIntOr(value, -1); return; }
    }
    else if (section == "Metadata") {
        if (key == "Title") { chart.title = value; return; }
        if (key == "Artist") { chart.artist = value; return; }
        if (key == "Creator") { chart.creator = value; return; }
        if (key == "Version") { chart.difficultyName = value; return; }
        if (key == "BeatmapID") {
            chart.beatmapId = std::max<int64_t>(0, TextUtils::parseIntOr(value, 0));
            return;
        }
        if (key == "BeatmapSetID") {
            chart.beatmapSetId = std::max<int64_t>(0, TextUtils::parseIntOr(value, 0));
            return;
        }
    }
    chart.extra[section + "." + key] = value;
}

bool OsuParser::parse(const std::string& text, ChartRecord& chart, IndexError& error) {
    std::string decoded;
    if (!TextUtils::decodeText(text, decoded)) {
        error = {ErrorKind::ParseError, chart.filePath, "not decodable text"};
        return false;
    }

    chart.beatmapId = 0;
    chart.beatmapSetId = 0;
    chart.title.clear();
    chart.artist.clear();
    chart.creator.clear();
    chart.difficultyName.clear();
    chart.audioFileName.clear();
    chart.mode = -1;
    chart.formatVersion = 0;
    chart.extra.clear();

    std::istringstream stream(decoded);
    std::string line;
    std::string section;
    bool sawGeneral = false;
    bool sawMetadata = false;

    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.compare(0, 2, "//") == 0) continue;

        if (section.empty() && line.compare(0, 17, FORMAT_HEADER) == 0) {
            chart.formatVersion = parseSmallIntOr(line.substr(17), 0);
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            if (section == "General") sawGeneral = true;
            if (section == "Metadata") sawMetadata = true;
            continue;
        }

        // Events, TimingPoints and HitObjects are positional records
        if (!isKeyValueSection(section)) continue;

        size_t colonPos = line.find(':');
        if (colonPos == std::string::npos) continue;
        std::string key = trim(line.substr(0, colonPos));
        std::string value = trim(line.substr(colonPos + 1));
        if (key.empty()) continue;

        applyField(section, key, value, chart);
    }

    if (!sawGeneral && !sawMetadata) {
        error = {ErrorKind::ParseError, chart.filePath, "missing [General] and [Metadata] sections"};
        return false;
    }
    return true;
}

bool OsuParser::parseFile(const std::string& filepath, ChartRecord& chart, IndexError& error) {
    chart.filePath = filepath;
    chart.folderPath = fs::path(filepath).parent_path().string();

    std::ifstream file(filepath, std::ios::binary);
    if (!file.is_open()) {
        error = {ErrorKind::ParseError, filepath, "cannot open file"};
        return false;
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        error = {ErrorKind::ParseError, filepath, "read error"};
        return false;
    }

    chart.hash = MD5::hash(bytes);
    if (!parse(bytes, chart, error)) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "OsuParser: %s: %s",
                     filepath.c_str(), error.message.c_str());
        return false;
    }
    return true;
}

std::string OsuParser::serialize(const ChartRecord& chart) {
    std::ostringstream out;
    if (chart.formatVersion > 0) {
        out << FORMAT_HEADER << chart.formatVersion << "\n\n";
    }

    for (const char* name : KEY_VALUE_SECTIONS) {
        std::string section = name;
        out << "[" << section << "]\n";
        if (section == "General") {
            if (!chart.audioFileName.empty()) out << "AudioFilename: " << chart.audioFileName << "\n";
            if (chart.mode >= 0) out << "Mode: " << chart.mode << "\n";
        }
        else if (section == "Metadata") {
            out << "Title:" << chart.title << "\n";
            out << "Artist:" << chart.artist << "\n";
            out << "Creator:" << chart.creator << "\n";
            out << "Version:" << chart.difficultyName << "\n";
            out << "BeatmapID:" << chart.beatmapId << "\n";
            out << "BeatmapSetID:" << chart.beatmapSetId << "\n";
        }
        writeExtras(out, chart, section);
        out << "\n";
    }

    return out.str();
}
