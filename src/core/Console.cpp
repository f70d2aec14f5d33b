#include "Console.h"
#include "Config.h"
#include "TextUtils.h"
#include "../systems/SongIndex.h"
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace fs = std::filesystem;

namespace {

const char* CONFIG_FILE = "config.ini";

// Truncates to width bytes; metadata is mostly ASCII so this is close enough for a table
std::string fit(const std::string& s, size_t width) {
    if (s.size() <= width) return s;
    if (width <= 3) return s.substr(0, width);
    return s.substr(0, width - 3) + "...";
}

std::string setIdText(int64_t id) {
    return id == 0 ? "-" : std::to_string(id);
}

} // anonymous namespace

Console::Console(std::istream& in, std::ostream& out) : in(in), out(out), configPath(CONFIG_FILE) {}

ScanOptions Console::makeScanOptions() {
    ScanOptions options;
    options.threads = settings.scanThreads;
    options.progress = [this](int done, int total, const std::string& folder) {
        out << "\rScanning " << std::setw(3) << (total > 0 ? done * 100 / total : 100) << "% "
            << std::left << std::setw(60) << fit(folder, 60) << std::right << std::flush;
        if (done == total) out << "\n";
    };
    return options;
}

bool Console::init(int argc, char* argv[]) {
    std::string pathArg;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            out << "usage: " << argv[0] << " [--config <file>] [songs folder]\n";
            return false;
        } else {
            pathArg = arg;
        }
    }

    Config::load(configPath, settings);
    Config::applyLogging(settings);

    library = std::make_unique<Library>(std::make_unique<SongIndex>(settings.cachePath), makeScanOptions());

    if (!pathArg.empty()) {
        settings.songsPath = pathArg;
        Config::save(configPath, settings);
    }

    while (settings.songsPath.empty()) {
        if (!promptForPath()) return false;
    }

    IndexError error;
    if (!library->open(settings.songsPath, error)) {
        printError(error);
        if (error.kind == ErrorKind::RootPathInvalid) {
            out << "use `path` to choose the osu! Songs folder\n";
        }
    } else {
        printScanSummary();
    }
    return true;
}

bool Console::promptForPath() {
    out << "path: " << (settings.songsPath.empty() ? "(not set)" : settings.songsPath) << "\n";
    out << "switch to (enter `q` to cancel):\n> " << std::flush;

    std::string line;
    if (!std::getline(in, line)) return false;
    line = TextUtils::trim(line);
    if (line == "q") return !settings.songsPath.empty();

    std::error_code ec;
    if (!fs::is_directory(line, ec)) {
        out << "invalid path.\n";
        return true;
    }
    settings.songsPath = line;
    Config::save(configPath, settings);
    return true;
}

bool Console::setSongsPath(const std::string& path) {
    std::error_code ec;
    if (!fs::is_directory(path, ec)) {
        printError({ErrorKind::RootPathInvalid, path, "not a directory"});
        return false;
    }

    settings.songsPath = path;
    Config::save(configPath, settings);

    IndexError error;
    if (!library->changeRoot(path, error)) {
        printError(error);
        return false;
    }
    printScanSummary();
    return true;
}

void Console::run() {
    printHelp();
    std::string line;
    while (true) {
        out << "> " << std::flush;
        if (!std::getline(in, line)) break;
        if (!execute(line)) break;
    }
}

bool Console::execute(const std::string& rawLine) {
    std::string line = TextUtils::trim(rawLine);
    if (line.empty()) return true;

    size_t space = line.find(' ');
    std::string command = TextUtils::toLowerAscii(line.substr(0, space));
    std::string args = space == std::string::npos ? "" : TextUtils::trim(line.substr(space + 1));

    IndexError error;
    if (command == "exit" || command == "quit") {
        return false;
    }
    else if (command == "list") {
        printSets(library->list());
    }
    else if (command == "find") {
        if (args.empty()) {
            out << "keyword:\n> " << std::flush;
            if (!std::getline(in, args)) return false;
        }
        auto results = library->find(args, error);
        if (results) {
            printSets(*results);
        } else {
            printError(error);
        }
    }
    else if (command == "check") {
        // Pick up folders changed since the last scan first
        if (!library->refresh(error)) {
            printError(error);
        }
        printGroups(library->check());
    }
    else if (command == "flush") {
        if (library->flush(error)) {
            printScanSummary();
        } else {
            printError(error);
        }
    }
    else if (command == "path") {
        if (args.empty()) {
            out << "path: " << settings.songsPath << " (" << library->getIndex().size() << ")\n";
        } else {
            setSongsPath(args);
        }
    }
    else if (command == "help") {
        printHelp();
    }
    else {
        out << "unknown command: " << command << "\n";
        printHelp();
    }
    return true;
}

void Console::printHelp() {
    out << "path: " << settings.songsPath << " (" << library->getIndex().size() << ")\n";
    out << "command:\n";
    out << "- check | exit | find [sid|name|artist|creator=]<keyword> | flush | list | path [<folder>]\n";
}

void Console::printSets(const QueryResults& results) {
    out << std::left
        << std::setw(10) << "sid" << " | "
        << std::setw(24) << "artist" << " | "
        << std::setw(36) << "name" << " | "
        << std::setw(16) << "creator" << " | "
        << "diffs\n";
    out << std::string(100, '-') << "\n";

    size_t total = 0;
    const ChartRecord blank;
    for (const auto& match : results) {
        const auto& charts = match.set->charts;
        const ChartRecord& chart = charts.empty() ? blank : charts[match.charts.empty() ? 0 : match.charts.front()];
        out << std::setw(10) << setIdText(match.set->beatmapSetId) << " | "
            << std::setw(24) << fit(chart.artist, 24) << " | "
            << std::setw(36) << fit(chart.title, 36) << " | "
            << std::setw(16) << fit(chart.creator, 16) << " | "
            << match.charts.size() << "/" << match.set->charts.size() << "\n";
        total++;
    }
    out << std::right << "total: " << total << "\n";
}

void Console::printGroups(const std::vector<DuplicateGroup>& groups) {
    size_t sets = 0;
    for (const auto& group : groups) {
        const BeatmapSet* first = group.sets.front();
        const ChartRecord& chart = first->charts.front();
        out << "[" << (group.rule == DuplicateRule::SetId ? "sid " + setIdText(first->beatmapSetId)
                                                           : std::string("same content"))
            << "] " << chart.artist << " - " << chart.title << "\n";
        for (const BeatmapSet* set : group.sets) {
            out << "    " << set->folderPath << " (" << set->charts.size() << " diffs)\n";
            sets++;
        }
    }
    out << "total: " << groups.size() << " groups, " << sets << " folders\n";
}

void Console::printError(const IndexError& error) {
    out << errorKindName(error.kind) << ": " << error.message;
    if (!error.path.empty()) out << " (" << error.path << ")";
    out << "\n";
}

void Console::printScanSummary() {
    const ScanSummary& summary = library->getLastScan();
    out << summary.setsIndexed << " sets indexed, " << summary.setsReused << " from cache, "
        << summary.chartsParsed << " charts parsed";
    if (summary.skippedFolders > 0 || !summary.warnings.empty()) {
        out << ", " << summary.skippedFolders << " folders skipped, "
            << summary.warnings.size() << " warnings";
    }
    out << "\n";
}
