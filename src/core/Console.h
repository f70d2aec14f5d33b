#pragma once
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>
#include "Library.h"
#include "../Settings.h"

// Interactive command loop: list, find, check, flush, path, exit
class Console {
public:
    Console(std::istream& in, std::ostream& out);

    bool init(int argc, char* argv[]);
    void run();

    // Executes one command line; returns false on exit
    bool execute(const std::string& line);

private:
    void printHelp();
    void printSets(const QueryResults& results);
    void printGroups(const std::vector<DuplicateGroup>& groups);
    void printError(const IndexError& error);
    void printScanSummary();

    bool promptForPath();
    bool setSongsPath(const std::string& path);
    ScanOptions makeScanOptions();

    std::istream& in;
    std::ostream& out;
    std::string configPath;
    Settings settings;
    std::unique_ptr<Library> library;
};
