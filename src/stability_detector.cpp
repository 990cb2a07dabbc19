#include "stability_detector.hpp"
#include "cancellation.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <regex>
#include <dirent.h>
#include <sys/stat.h>

namespace filemover {

static const std::string REGEX_PREFIX = "regex:";

static bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

FileFilter::FileFilter(const std::string& expression) {
    if (expression.compare(0, REGEX_PREFIX.size(), REGEX_PREFIX) == 0) {
        is_regex_ = true;
        pattern_ = expression.substr(REGEX_PREFIX.size());
        try {
            regex_ = std::make_shared<std::regex>(pattern_);
        } catch (const std::regex_error& e) {
            Logger::warn("[Detector] Invalid filter pattern '" + pattern_ + "': " + e.what());
        }
    } else {
        suffix_ = expression;
    }
}

bool FileFilter::matches(const std::string& filename) const {
    if (is_regex_) {
        return regex_ && std::regex_search(filename, *regex_);
    }
    return suffix_.empty() || ends_with(filename, suffix_);
}

std::string FileFilter::validate(const std::string& expression) {
    if (expression.compare(0, REGEX_PREFIX.size(), REGEX_PREFIX) != 0) {
        return "";
    }
    std::string pattern = expression.substr(REGEX_PREFIX.size());
    if (pattern.empty()) {
        return "file_filter: empty regex pattern";
    }
    try {
        std::regex check(pattern);
    } catch (const std::regex_error& e) {
        return "file_filter: invalid regex '" + pattern + "': " + e.what();
    }
    return "";
}

StabilityDetector::StabilityDetector(Options options)
    : options_(std::move(options))
    , filter_(options_.filter) {
    if (options_.poll_interval.count() <= 0) {
        options_.poll_interval = std::chrono::milliseconds(500);
    }
}

std::vector<CandidateFile> StabilityDetector::scan() const {
    std::vector<CandidateFile> candidates;

    DIR* dir = opendir(options_.source_dir.c_str());
    if (!dir) {
        Logger::warn("[Detector] Cannot open " + options_.source_dir + ": " + std::strerror(errno));
        return candidates;
    }

    while (struct dirent* entry = readdir(dir)) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        if (!filter_.matches(name)) continue;

        std::string path = options_.source_dir;
        if (path.empty() || path.back() != '/') path += '/';
        path += name;

        struct stat st;
        // A marker is only ours while the file it guards is still beside it
        if (name.size() > 5 && ends_with(name, ".lock") &&
            lstat(path.substr(0, path.size() - 5).c_str(), &st) == 0) {
            continue;
        }
        if (stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
            continue;
        }

        CandidateFile candidate;
        candidate.path = path;
        candidate.name = name;
        candidate.size = static_cast<uint64_t>(st.st_size);
        candidate.created = std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(st.st_ctim.tv_sec) + std::chrono::nanoseconds(st.st_ctim.tv_nsec)));
        candidates.push_back(std::move(candidate));
    }
    closedir(dir);

    std::sort(candidates.begin(), candidates.end(), [](const CandidateFile& a, const CandidateFile& b) {
        if (a.created != b.created) return a.created < b.created;
        return a.name < b.name;
    });
    return candidates;
}

StabilityVerdict StabilityDetector::check(const CandidateFile& candidate, CancellationToken& token) const {
    StabilityVerdict verdict;
    verdict.candidate = candidate;

    struct stat st;
    if (stat(candidate.path.c_str(), &st) != 0) {
        verdict.reason = std::string("stat failed: ") + std::strerror(errno);
        Logger::debug("[Detector] " + candidate.name + ": " + verdict.reason);
        return verdict;
    }
    off_t initial_size = st.st_size;
    if (initial_size == 0) {
        verdict.reason = "empty file";
        return verdict;
    }

    auto deadline = std::chrono::steady_clock::now() + options_.window;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;

        auto wait = std::min<std::chrono::steady_clock::duration>(options_.poll_interval, deadline - now);
        if (!token.sleep_for(wait)) {
            verdict.reason = "cancelled";
            return verdict;
        }

        if (stat(candidate.path.c_str(), &st) != 0) {
            verdict.reason = std::string("stat failed: ") + std::strerror(errno);
            Logger::debug("[Detector] " + candidate.name + ": " + verdict.reason);
            return verdict;
        }
        if (st.st_size != initial_size) {
            verdict.reason = "size changed from " + std::to_string(initial_size) + " to " +
                             std::to_string(st.st_size);
            Logger::debug("[Detector] " + candidate.name + " still being written (" + verdict.reason + ")");
            return verdict;
        }
    }

    verdict.candidate.size = static_cast<uint64_t>(initial_size);
    verdict.stable = true;
    return verdict;
}

std::vector<CandidateFile> StabilityDetector::detect(CancellationToken& token) const {
    std::vector<CandidateFile> candidates = scan();
    std::vector<CandidateFile> stable;
    if (candidates.empty()) {
        return stable;
    }

    Logger::debug("[Detector] Checking " + std::to_string(candidates.size()) + " candidate(s)");

    std::vector<std::future<StabilityVerdict>> pending;
    pending.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        pending.push_back(std::async(std::launch::async, [this, &candidate, &token]() {
            return check(candidate, token);
        }));
    }

    for (auto& future : pending) {
        StabilityVerdict verdict;
        try {
            verdict = future.get();
        } catch (const std::exception& e) {
            Logger::error("[Detector] Stability check failed: " + std::string(e.what()));
            continue;
        }
        if (verdict.stable && !token.is_cancelled()) {
            stable.push_back(std::move(verdict.candidate));
        }
    }

    if (!stable.empty()) {
        Logger::info("[Detector] " + std::to_string(stable.size()) + " of " +
                     std::to_string(candidates.size()) + " file(s) ready");
    }
    return stable;
}

} // namespace filemover
