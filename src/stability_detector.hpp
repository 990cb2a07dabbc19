#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace filemover {

class CancellationToken;

/**
 * A regular file found in the source directory during one scan
 */
struct CandidateFile {
    std::string path;
    std::string name;
    uint64_t size = 0;
    std::chrono::system_clock::time_point created;  // st_ctim
};

struct StabilityVerdict {
    CandidateFile candidate;
    bool stable = false;
    std::string reason;  // empty when stable
};

/**
 * File name filter.
 *
 * "" matches everything, "regex:<pattern>" searches the name with an
 * ECMAScript regex, anything else is a suffix match.
 */
class FileFilter {
public:
    FileFilter() = default;
    explicit FileFilter(const std::string& expression);

    bool matches(const std::string& filename) const;

    // Returns an error message for an unusable expression, empty if valid
    static std::string validate(const std::string& expression);

private:
    std::string suffix_;
    bool is_regex_ = false;
    std::string pattern_;
    std::shared_ptr<std::regex> regex_;  // null if the pattern failed to compile
};

/**
 * Stability Detector
 *
 * A file is stable once its size stays unchanged for a whole stability
 * window. Empty files are never stable. All candidates of a scan are polled
 * concurrently, so detect() takes about one window regardless of their number.
 */
class StabilityDetector {
public:
    struct Options {
        std::string source_dir;
        std::string filter;
        std::chrono::milliseconds window{5000};
        std::chrono::milliseconds poll_interval{500};
    };

    explicit StabilityDetector(Options options);

    // Regular files matching the filter, oldest change time first
    std::vector<CandidateFile> scan() const;

    StabilityVerdict check(const CandidateFile& candidate, CancellationToken& token) const;

    // The stable subsequence of scan(), in scan order
    std::vector<CandidateFile> detect(CancellationToken& token) const;


private:
    Options options_;
    FileFilter filter_;
};

} // namespace filemover
