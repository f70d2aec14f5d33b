#include "Config.h"
#include "TextUtils.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <SDL3/SDL.h>

namespace fs = std::filesystem;

bool Config::save(const std::string& path, const Settings& settings) {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[CONFIG] Cannot write %s", path.c_str());
        return false;
    }

    file << "[General]\n";
    file << "songsPath=" << settings.songsPath << "\n";
    file << "cachePath=" << settings.cachePath << "\n";

    file << "\n[Scan]\n";
    file << "scanThreads=" << settings.scanThreads << "\n";

    file << "\n[Misc]\n";
    file << "debugLogging=" << (settings.debugLogging ? 1 : 0) << "\n";

    return file.good();
}

bool Config::load(const std::string& path, Settings& settings) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return true;

    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[CONFIG] Cannot read %s, using defaults", path.c_str());
        return false;
    }

    std::string line, section;
    while (std::getline(file, line)) {
        line = TextUtils::trim(line);
        if (line.empty()) continue;

        // Skip comments
        if (line[0] == ';' || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key=value
        size_t eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = TextUtils::trim(line.substr(0, eq));
        std::string value = TextUtils::trim(line.substr(eq + 1));

        if (section == "General") {
            if (key == "songsPath") settings.songsPath = value;
            else if (key == "cachePath" && !value.empty()) settings.cachePath = value;
        }
        else if (section == "Scan") {
            if (key == "scanThreads") {
                int64_t threads = TextUtils::parseIntOr(value, settings.scanThreads);
                settings.scanThreads = (int)std::clamp<int64_t>(threads, 0, Settings::MAX_SCAN_THREADS);
            }
        }
        else if (section == "Misc") {
            if (key == "debugLogging") settings.debugLogging = (value == "1");
        }
    }
    return true;
}

void Config::applyLogging(const Settings& settings) {
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION,
                       settings.debugLogging ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_INFO);
}
