#pragma once
#include <string>
#include "../Settings.h"

class Config {
public:
    // Missing file leaves the defaults; returns false only if it exists but cannot be read
    static bool load(const std::string& path, Settings& settings);
    static bool save(const std::string& path, const Settings& settings);

    // Applies Settings::debugLogging to the SDL log priorities
    static void applyLogging(const Settings& settings);
};
