#include "SetScanner.h"
#include "Fingerprint.h"
#include "../core/TextUtils.h"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <SDL3/SDL.h>
#include "../Settings.h"

namespace fs = std::filesystem;

enum class FolderOutcome {
    Pending,
    Reused,
    Parsed,
    Empty,       // No .osu files
    NoCharts,    // .osu files present, none parseable
    Unreadable
};

namespace {

// Joins every started worker on scope exit, so an exception thrown while
// starting threads or reporting progress never destroys a joinable thread
class WorkerGroup {
public:
    explicit WorkerGroup(std::atomic<bool>& abandon) : abandon(abandon) {}
    ~WorkerGroup() {
        abandon = true;
        join();
    }
    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    template <typename Fn>
    void start(int count, Fn fn) {
        threads.reserve(count);
        for (int t = 0; t < count; t++) {
            threads.emplace_back(fn);
        }
    }

    void join() {
        for (auto& t : threads) {
            if (t.joinable()) t.join();
        }
    }

private:
    std::atomic<bool>& abandon;
    std::vector<std::thread> threads;
};

} // anonymous namespace

struct SetScanner::FolderJob {
    std::string path;
    FolderOutcome outcome = FolderOutcome::Pending;
    BeatmapSet set;
    int chartsParsed = 0;
    std::vector<IndexError> warnings;
};

int64_t SetScanner::setIdFromFolderName(const std::string& folderName) {
    size_t digits = 0;
    while (digits < folderName.size() && folderName[digits] >= '0' && folderName[digits] <= '9') {
        digits++;
    }
    if (digits == 0) return 0;
    if (digits < folderName.size() && folderName[digits] != ' ') return 0;
    return std::max<int64_t>(0, TextUtils::parseIntOr(folderName.substr(0, digits), 0));
}

bool SetScanner::collectFolders(const std::string& rootPath, std::vector<std::string>& folders,
                                IndexError& error) {
    std::error_code ec;
    if (rootPath.empty() || !fs::is_directory(rootPath, ec)) {
        error = {ErrorKind::RootPathInvalid, rootPath, "songs folder not found"};
        return false;
    }

    fs::directory_iterator it(rootPath, ec);
    if (ec) {
        error = {ErrorKind::RootPathInvalid, rootPath, ec.message()};
        return false;
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::error_code entryEc;
        if (it->is_directory(entryEc) && !entryEc) {
            folders.push_back(it->path().string());
        }
    }
    if (ec) {
        error = {ErrorKind::RootPathInvalid, rootPath, ec.message()};
        return false;
    }

    std::sort(folders.begin(), folders.end());
    return true;
}

void SetScanner::processFolder(FolderJob& job, const BeatmapIndex& previous) {
    std::vector<FolderEntry> entries;
    std::string message;
    if (!Fingerprint::listFolder(job.path, entries, message)) {
        job.warnings.push_back({ErrorKind::ScanWarning, job.path, message});
        job.outcome = FolderOutcome::Unreadable;
        return;
    }

    std::string fingerprint = Fingerprint::compute(job.path, entries);
    const BeatmapSet* cached = previous.find(job.path);
    if (cached && cached->fingerprint == fingerprint) {
        job.set = *cached;
        job.outcome = FolderOutcome::Reused;
        return;
    }

    job.set.folderPath = job.path;
    job.set.fingerprint = fingerprint;

    bool anyChartFile = false;
    for (const auto& entry : entries) {
        if (!OsuParser::isChartFile(entry.name)) continue;
        anyChartFile = true;

        ChartRecord chart;
        IndexError error;
        job.chartsParsed++;
        std::string chartPath = (fs::path(job.path) / entry.name).string();
        if (!OsuParser::parseFile(chartPath, chart, error)) {
            job.warnings.push_back(error);
            continue;
        }
        job.set.charts.push_back(std::move(chart));
    }

    if (!anyChartFile) {
        job.outcome = FolderOutcome::Empty;
        return;
    }
    if (job.set.charts.empty()) {
        job.warnings.push_back({ErrorKind::ScanWarning, job.path, "no parseable chart files"});
        job.outcome = FolderOutcome::NoCharts;
        return;
    }

    for (const auto& chart : job.set.charts) {
        if (chart.beatmapSetId != 0) {
            job.set.beatmapSetId = chart.beatmapSetId;
            break;
        }
    }
    // Old format versions carry no BeatmapSetID; downloads are named "<sid> <artist> - <title>"
    if (job.set.beatmapSetId == 0) {
        job.set.beatmapSetId = setIdFromFolderName(fs::path(job.path).filename().string());
    }
    job.outcome = FolderOutcome::Parsed;
}

bool SetScanner::scan(const std::string& rootPath, const BeatmapIndex& previous,
                      const ScanOptions& options, BeatmapIndex& result,
                      ScanSummary& summary, IndexError& error) {
    summary = ScanSummary();

    std::vector<std::string> folders;
    if (!collectFolders(rootPath, folders, error)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[SCAN] %s: %s",
                     rootPath.c_str(), error.message.c_str());
        return false;
    }

    std::vector<FolderJob> jobs(folders.size());
    for (size_t i = 0; i < folders.size(); i++) {
        jobs[i].path = folders[i];
    }
    int total = (int)jobs.size();
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "[SCAN] Found %d folders in %s", total, rootPath.c_str());

    int threadCount = options.threads;
    if (threadCount <= 0) threadCount = (int)std::thread::hardware_concurrency();
    threadCount = std::clamp(threadCount, 1, Settings::MAX_SCAN_THREADS);
    threadCount = std::min(threadCount, std::max(total, 1));

    // Workers only fill their own job slot; the index is assembled below
    std::mutex progressMutex;
    std::condition_variable progressCv;
    int completed = 0;
    std::string lastFolder;
    std::atomic<size_t> nextJob{0};
    std::atomic<bool> abandoned{false};

    auto worker = [&]() {
        while (true) {
            if (abandoned.load()) break;
            if (options.cancel && options.cancel->load()) break;
            size_t i = nextJob.fetch_add(1);
            if (i >= jobs.size()) break;

            FolderJob& job = jobs[i];
            try {
                processFolder(job, previous);
            } catch (const std::exception& e) {
                job.set = BeatmapSet();
                job.warnings.push_back({ErrorKind::ScanWarning, job.path, e.what()});
                job.outcome = FolderOutcome::Unreadable;
            }

            {
                std::lock_guard<std::mutex> lock(progressMutex);
                completed++;
                lastFolder = fs::path(job.path).filename().string();
            }
            progressCv.notify_one();
        }
        // Wake the reporter if this worker stopped early on cancel
        progressCv.notify_one();
    };

    WorkerGroup workers(abandoned);
    workers.start(threadCount, worker);

    int reported = 0;
    while (reported < total) {
        std::string folderName;
        {
            std::unique_lock<std::mutex> lock(progressMutex);
            progressCv.wait(lock, [&]() {
                return completed > reported || (options.cancel && options.cancel->load());
            });
            if (completed == reported) break;  // Cancelled
            reported = completed;
            folderName = lastFolder;
        }
        if (options.progress) options.progress(reported, total, folderName);
    }

    workers.join();

    if (options.cancel && options.cancel->load()) {
        error = {ErrorKind::ScanWarning, rootPath, "scan cancelled"};
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[SCAN] Cancelled, keeping the previous index");
        return false;
    }

    BeatmapIndex::SetMap sets;
    summary.foldersSeen = total;
    for (auto& job : jobs) {
        summary.chartsParsed += job.chartsParsed;
        for (auto& warning : job.warnings) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "[SCAN] %s: %s: %s",
                        errorKindName(warning.kind), warning.path.c_str(), warning.message.c_str());
            summary.warnings.push_back(std::move(warning));
        }

        switch (job.outcome) {
            case FolderOutcome::Reused:
                summary.setsReused++;
                sets.emplace(job.path, std::move(job.set));
                break;
            case FolderOutcome::Parsed:
                sets.emplace(job.path, std::move(job.set));
                break;
            case FolderOutcome::Empty:
                summary.emptyFolders++;
                break;
            case FolderOutcome::NoCharts:
            case FolderOutcome::Unreadable:
            case FolderOutcome::Pending:
                summary.skippedFolders++;
                break;
        }
    }
    summary.setsIndexed = (int)sets.size();

    result.setRootPath(rootPath);
    result.replaceAll(std::move(sets));

    SDL_Log("[SCAN] %d sets indexed (%d reused, %d charts parsed), %d empty, %d skipped",
            summary.setsIndexed, summary.setsReused, summary.chartsParsed,
            summary.emptyFolders, summary.skippedFolders);
    return true;
}
