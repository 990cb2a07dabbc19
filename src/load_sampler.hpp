#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace filemover {

/**
 * One reading of system load
 */
struct LoadSample {
    double cpu_percent = 0.0;       // 0-100, across all CPUs
    double load_average = -1.0;     // 1-minute load average, -1 if unknown
    double memory_percent = -1.0;   // used memory, -1 if unknown
    double disk_free_gb = -1.0;     // free space at the probed path, -1 if unknown
};

/**
 * Source of system load readings for the concurrency governor.
 */
class LoadSampler {
public:
    virtual ~LoadSampler() = default;

    // False when no load signal exists in this environment
    virtual bool available() const = 0;

    // Returns std::nullopt when the reading failed
    virtual std::optional<LoadSample> sample() = 0;
};

/**
 * No load signal: the governor keeps the configured maximum.
 */
class NullLoadSampler : public LoadSampler {
public:
    bool available() const override { return false; }
    std::optional<LoadSample> sample() override { return std::nullopt; }
};

/**
 * Linux sampler based on /proc/stat, /proc/meminfo, getloadavg() and statvfs().
 *
 * CPU percent is computed from the delta between consecutive /proc/stat
 * reads; the first call primes the counters over a short interval.
 */
class ProcLoadSampler : public LoadSampler {
public:
    explicit ProcLoadSampler(std::string disk_probe_path = "/");

    bool available() const override;
    std::optional<LoadSample> sample() override;

private:
    struct CpuTimes {
        uint64_t idle = 0;
        uint64_t total = 0;
    };

    static std::optional<CpuTimes> read_cpu_times();
    static double read_memory_percent();
    double read_disk_free_gb() const;

    std::string disk_probe_path_;
    std::mutex mutex_;
    std::optional<CpuTimes> previous_;
};

} // namespace filemover
