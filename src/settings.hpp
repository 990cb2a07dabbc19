#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace filemover {

/**
 * Typed, validated view of the settings consumed by the pipeline
 */
struct MoverConfig {
    std::string source_dir;
    std::string destination_dir;

    std::chrono::milliseconds stability_window{std::chrono::seconds(5)};
    std::chrono::milliseconds stability_poll_interval{500};
    std::chrono::milliseconds scan_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds inactivity_threshold{std::chrono::minutes(5)};
    std::chrono::milliseconds health_check_interval{std::chrono::hours(1)};
    std::chrono::milliseconds shutdown_grace{std::chrono::seconds(10)};
    std::chrono::milliseconds load_sample_interval{std::chrono::seconds(30)};
    std::chrono::seconds notification_rate_limit{30};

    bool verify_checksum = false;
    bool dry_run = false;
    std::string file_filter;

    uint64_t max_bandwidth = 1024 * 1024;  // bytes/s, 0 = unlimited
    int max_workers = 4;

    int retry_attempts = 5;
    double backoff_base_seconds = 1.0;
    double backoff_multiplier = 2.0;

    uint64_t progress_threshold_bytes = 50ull * 1024 * 1024;
};

/**
 * Settings
 *
 * Flat key/value settings persisted as a JSON object, by default at
 * ~/.config/filemover/settings.json. Missing keys are filled with defaults
 * on load; values set on the command line override file values through the
 * generic setters.
 */
class Settings {
public:
    explicit Settings(std::string config_path = default_config_path());

    static std::string default_config_path();

    // Returns false if the file does not exist or cannot be read; defaults
    // are applied either way
    bool load();
    bool save();

    // Human-readable problems; empty when the settings are usable
    std::vector<std::string> validate() const;

    MoverConfig to_config() const;

    std::string get_string(const std::string& key, const std::string& default_value = "") const;
    void set_string(const std::string& key, const std::string& value);

    int64_t get_int(const std::string& key, int64_t default_value = 0) const;
    void set_int(const std::string& key, int64_t value);

    double get_double(const std::string& key, double default_value = 0.0) const;

    bool get_bool(const std::string& key, bool default_value = false) const;
    void set_bool(const std::string& key, bool value);

    const std::string& path() const { return config_path_; }

    // Common accessors
    bool desktop_notifications() const { return get_bool("desktop_notifications", true); }
    bool debug_logging() const { return get_bool("debug_logging", false); }
    std::string log_file() const;
    std::string metrics_db() const;

private:
    void ensure_defaults();
    void parse(const std::string& content);

    mutable std::mutex mutex_;
    std::map<std::string, std::string> settings_;
    std::string config_path_;
};

} // namespace filemover
