#pragma once
#include <string>

struct Settings {
    // [General]
    std::string songsPath;   // osu! Songs folder, empty until the user sets it
    std::string cachePath;   // Index file

    // [Scan]
    int scanThreads;         // 0 = one per hardware thread

    // [Misc]
    bool debugLogging;

    static constexpr int MAX_SCAN_THREADS = 64;

    Settings() {
        cachePath = "Data/Index/beatmaps.idx";
        scanThreads = 0;
        debugLogging = false;
    }
};
