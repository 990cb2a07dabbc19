#include "load_sampler.hpp"
#include "logger.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>
#include <sys/statvfs.h>
#include <unistd.h>

namespace filemover {

ProcLoadSampler::ProcLoadSampler(std::string disk_probe_path)
    : disk_probe_path_(std::move(disk_probe_path)) {
}

bool ProcLoadSampler::available() const {
    return access("/proc/stat", R_OK) == 0;
}

std::optional<ProcLoadSampler::CpuTimes> ProcLoadSampler::read_cpu_times() {
    std::ifstream stat_file("/proc/stat");
    if (!stat_file.is_open()) {
        return std::nullopt;
    }

    // First line: "cpu  user nice system idle iowait irq softirq steal ..."
    std::string line;
    if (!std::getline(stat_file, line) || line.compare(0, 3, "cpu") != 0) {
        return std::nullopt;
    }

    std::istringstream iss(line.substr(3));
    CpuTimes times;
    uint64_t value = 0;
    int field = 0;
    while (iss >> value) {
        times.total += value;
        // idle + iowait
        if (field == 3 || field == 4) {
            times.idle += value;
        }
        ++field;
    }
    if (field < 4) {
        return std::nullopt;
    }
    return times;
}

double ProcLoadSampler::read_memory_percent() {
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo.is_open()) return -1.0;

    uint64_t total_kb = 0;
    uint64_t available_kb = 0;
    std::string key;
    uint64_t value = 0;
    std::string unit;
    while (meminfo >> key >> value) {
        std::getline(meminfo, unit);
        if (key == "MemTotal:") total_kb = value;
        else if (key == "MemAvailable:") available_kb = value;
        if (total_kb && available_kb) break;
    }
    if (total_kb == 0) return -1.0;
    return 100.0 * static_cast<double>(total_kb - available_kb) / static_cast<double>(total_kb);
}

double ProcLoadSampler::read_disk_free_gb() const {
    struct statvfs vfs;
    if (statvfs(disk_probe_path_.c_str(), &vfs) != 0) {
        return -1.0;
    }
    double free_bytes = static_cast<double>(vfs.f_bavail) * static_cast<double>(vfs.f_frsize);
    return free_bytes / (1024.0 * 1024.0 * 1024.0);
}

std::optional<LoadSample> ProcLoadSampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now_times = read_cpu_times();
    if (!now_times) {
        Logger::debug("[LoadSampler] /proc/stat unreadable");
        return std::nullopt;
    }

    if (!previous_) {
        previous_ = now_times;
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        now_times = read_cpu_times();
        if (!now_times) return std::nullopt;
    }

    LoadSample result;
    uint64_t total_delta = now_times->total - previous_->total;
    uint64_t idle_delta = now_times->idle - previous_->idle;
    if (total_delta > 0) {
        result.cpu_percent = 100.0 * static_cast<double>(total_delta - idle_delta) /
                             static_cast<double>(total_delta);
    }
    previous_ = now_times;

    double loads[1];
    if (getloadavg(loads, 1) == 1) {
        result.load_average = loads[0];
    }
    result.memory_percent = read_memory_percent();
    result.disk_free_gb = read_disk_free_gb();

    return result;
}

} // namespace filemover
