#include "run_statistics.hpp"
#include "file_helpers.hpp"

#include <sstream>

namespace filemover {

RunStatistics::RunStatistics()
    : start_time_(std::chrono::steady_clock::now())
    , last_success_(start_time_) {
}

void RunStatistics::record_success(const std::string& filename, uint64_t bytes, double duration_seconds) {
    total_moved_++;
    total_bytes_ += bytes;
    total_seconds_ += duration_seconds;
    last_success_ = std::chrono::steady_clock::now();

    TransferRecord record;
    record.filename = filename;
    record.bytes = bytes;
    record.duration_seconds = duration_seconds;
    record.success = true;
    remember(std::move(record));
}

void RunStatistics::record_failure(const std::string& filename, const std::string& error) {
    total_errors_++;

    TransferRecord record;
    record.filename = filename;
    record.success = false;
    record.error = error;
    remember(std::move(record));
}

void RunStatistics::reset_activity_timer() {
    last_success_ = std::chrono::steady_clock::now();
}

void RunStatistics::remember(TransferRecord record) {
    record.finished = std::chrono::system_clock::now();
    recent_.push_back(std::move(record));
    while (recent_.size() > MAX_HISTORY) {
        recent_.pop_front();
    }
}

std::chrono::seconds RunStatistics::uptime() const {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - start_time_);
}

std::chrono::steady_clock::duration RunStatistics::since_last_success() const {
    return std::chrono::steady_clock::now() - last_success_;
}

double RunStatistics::average_speed() const {
    if (total_seconds_ <= 0.0) return 0.0;
    return static_cast<double>(total_bytes_) / total_seconds_;
}

std::string RunStatistics::health_summary() const {
    std::ostringstream oss;
    oss << "Uptime: " << FileHelpers::format_duration(uptime()) << "\n"
        << "Files moved: " << total_moved_ << "\n"
        << "Errors: " << total_errors_ << "\n"
        << "Data moved: " << FileHelpers::format_bytes(total_bytes_) << "\n"
        << "Average speed: " << FileHelpers::format_speed(average_speed());
    return oss.str();
}

std::string RunStatistics::final_summary() const {
    std::ostringstream oss;
    oss << "File Mover stopped after " << FileHelpers::format_duration(uptime())
        << ". Total moved: " << total_moved_
        << " (" << FileHelpers::format_bytes(total_bytes_) << "), errors: " << total_errors_;
    return oss.str();
}

} // namespace filemover
