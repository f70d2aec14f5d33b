#pragma once
#include <cstdint>
#include <map>
#include <string>
#include "../core/IndexError.h"

// One difficulty of a beatmapset, as read from a .osu file
struct ChartRecord {
    int64_t beatmapId = 0;      // 0 = unsubmitted
    int64_t beatmapSetId = 0;   // As written in the file, 0 = absent
    std::string title;
    std::string artist;
    std::string creator;
    std::string difficultyName;  // [Metadata] Version
    std::string audioFileName;
    int mode = -1;               // -1 = not specified
    int formatVersion = 0;       // "osu file format vN", 0 = no header
    std::string filePath;
    std::string folderPath;
    std::string hash;            // MD5 of the file bytes
    // Key:Value lines not promoted above, keyed "Section.Key"
    std::map<std::string, std::string> extra;

    bool operator==(const ChartRecord& other) const;
    bool operator!=(const ChartRecord& other) const { return !(*this == other); }
};

class OsuParser {
public:
    // Pure parse of chart text (raw file bytes, any supported encoding)
    static bool parse(const std::string& text, ChartRecord& chart, IndexError& error);

    // Reads the file, fills filePath/folderPath/hash and parses it
    static bool parseFile(const std::string& filepath, ChartRecord& chart, IndexError& error);

    // Writes the recognised fields back as chart text
    static std::string serialize(const ChartRecord& chart);

    static bool isChartFile(const std::string& filename);

private:
    static bool isKeyValueSection(const std::string& section);
    static void applyField(const std::string& section, const std::string& key,
                           const std::string& value, ChartRecord& chart);
};
