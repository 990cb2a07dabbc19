#include "settings.hpp"
#include "file_helpers.hpp"
#include "logger.hpp"
#include "stability_detector.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace filemover {

namespace {

bool parse_int64(const std::string& text, int64_t& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(value);
    return true;
}

bool parse_double(const std::string& text, double& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
}

std::string json_escape(const std::string& value) {
    std::string out;
    for (char c : value) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

// Integer setting with inclusive bounds (max < min means unbounded above)
struct IntRule {
    const char* key;
    int64_t min;
    int64_t max;
};

const IntRule INT_RULES[] = {
    {"stability_wait", 1, -1},
    {"scan_interval", 1, -1},
    {"inactivity_threshold_minutes", 1, -1},
    {"max_bandwidth", 0, -1},
    {"max_workers", 1, 32},
    {"health_notification_interval", 60, -1},
    {"notification_rate_limit", 0, -1},
    {"retry_attempts", 1, 20},
    {"shutdown_grace", 1, -1},
    {"load_sample_interval", 1, -1},
    {"progress_tracking_threshold_bytes", 0, -1},
};

} // namespace

Settings::Settings(std::string config_path)
    : config_path_(std::move(config_path)) {
    ensure_defaults();
}

std::string Settings::default_config_path() {
    const char* home = std::getenv("HOME");
    if (home) {
        return std::string(home) + "/.config/filemover/settings.json";
    }
    return "settings.json";
}

void Settings::ensure_defaults() {
    static const std::pair<const char*, const char*> DEFAULTS[] = {
        {"source_dir", ""},
        {"destination_dir", ""},
        {"stability_wait", "5"},
        {"scan_interval", "10"},
        {"inactivity_threshold_minutes", "5"},
        {"verify_checksum", "false"},
        {"dry_run", "false"},
        {"file_filter", ""},
        {"max_bandwidth", "1048576"},
        {"max_workers", "4"},
        {"health_notification_interval", "3600"},
        {"notification_rate_limit", "30"},
        {"retry_attempts", "5"},
        {"backoff_base", "1"},
        {"backoff_multiplier", "2"},
        {"shutdown_grace", "10"},
        {"load_sample_interval", "30"},
        {"progress_tracking_threshold_bytes", "52428800"},
        {"desktop_notifications", "true"},
        {"pushover_app_token", ""},
        {"pushover_user_key", ""},
        {"selected_devices", ""},
        {"metrics_db", "~/.cache/filemover/metrics.db"},
        {"log_file", "~/.cache/filemover/filemover.log"},
        {"debug_logging", "false"},
    };
    for (const auto& entry : DEFAULTS) {
        if (settings_.find(entry.first) == settings_.end()) {
            settings_[entry.first] = entry.second;
        }
    }
}

void Settings::parse(const std::string& content) {
    // Flat JSON object: {"key": "value", "key": 123, ...}
    size_t pos = 0;
    while ((pos = content.find('"', pos)) != std::string::npos) {
        size_t key_start = pos + 1;
        size_t key_end = content.find('"', key_start);
        if (key_end == std::string::npos) break;

        std::string key = content.substr(key_start, key_end - key_start);

        size_t colon = content.find(':', key_end);
        if (colon == std::string::npos) break;

        size_t val_start = content.find_first_not_of(" \t\r\n", colon + 1);
        if (val_start == std::string::npos) break;

        std::string value;
        if (content[val_start] == '"') {
            size_t i = val_start + 1;
            while (i < content.size() && content[i] != '"') {
                if (content[i] == '\\' && i + 1 < content.size()) {
                    ++i;
                }
                value += content[i];
                ++i;
            }
            if (i >= content.size()) break;
            pos = i + 1;
        } else {
            size_t val_end = content.find_first_of(",}", val_start);
            if (val_end == std::string::npos) val_end = content.length();
            value = content.substr(val_start, val_end - val_start);
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
                value.pop_back();
            }
            pos = val_end;
        }

        settings_[key] = value;
    }
}

bool Settings::load() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        Logger::info("[Settings] No settings file at " + config_path_ + ", using defaults");
        ensure_defaults();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());

    ensure_defaults();
    Logger::info("[Settings] Loaded " + std::to_string(settings_.size()) + " settings from " + config_path_);
    return true;
}

bool Settings::save() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::filesystem::path dir = std::filesystem::path(config_path_).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::error("[Settings] Cannot create " + dir.string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(config_path_);
    if (!file.is_open()) {
        Logger::error("[Settings] Failed to open settings file for writing: " + config_path_);
        return false;
    }

    file << "{\n";
    bool first = true;
    for (const auto& [key, value] : settings_) {
        if (!first) file << ",\n";
        first = false;

        int64_t as_int = 0;
        bool is_numeric = parse_int64(value, as_int);
        bool is_bool = (value == "true" || value == "false");

        if (is_numeric || is_bool) {
            file << "  \"" << key << "\": " << value;
        } else {
            file << "  \"" << key << "\": \"" << json_escape(value) << "\"";
        }
    }
    file << "\n}\n";
    file.close();
    if (!file) {
        Logger::error("[Settings] Write failed: " + config_path_);
        return false;
    }

    Logger::info("[Settings] Saved " + std::to_string(settings_.size()) + " settings to " + config_path_);
    return true;
}

std::vector<std::string> Settings::validate() const {
    std::vector<std::string> errors;

    std::string source = FileHelpers::expand_home(get_string("source_dir"));
    std::string destination = FileHelpers::expand_home(get_string("destination_dir"));
    if (source.empty()) {
        errors.push_back("source_dir is required");
    } else {
        std::string reason;
        if (!FileHelpers::directory_accessible(source, &reason)) {
            errors.push_back("source_dir: " + reason);
        }
    }
    if (destination.empty()) {
        errors.push_back("destination_dir is required");
    } else if (FileHelpers::safe_exists(destination) && !FileHelpers::safe_is_directory(destination)) {
        errors.push_back("destination_dir exists but is not a directory: " + destination);
    }
    if (!source.empty() && source == destination) {
        errors.push_back("source_dir and destination_dir must differ");
    }

    for (const auto& rule : INT_RULES) {
        std::string text = get_string(rule.key);
        int64_t value = 0;
        if (!parse_int64(text, value)) {
            errors.push_back(std::string(rule.key) + ": not an integer: '" + text + "'");
            continue;
        }
        if (value < rule.min || (rule.max >= rule.min && value > rule.max)) {
            std::string range = rule.max >= rule.min
                ? std::to_string(rule.min) + "-" + std::to_string(rule.max)
                : ">= " + std::to_string(rule.min);
            errors.push_back(std::string(rule.key) + ": " + text + " out of range (" + range + ")");
        }
    }

    double base = 0.0;
    if (!parse_double(get_string("backoff_base"), base) || base <= 0.0) {
        errors.push_back("backoff_base: must be a number > 0");
    }
    double multiplier = 0.0;
    if (!parse_double(get_string("backoff_multiplier"), multiplier) || multiplier < 1.0) {
        errors.push_back("backoff_multiplier: must be a number >= 1");
    }

    std::string filter_error = FileFilter::validate(get_string("file_filter"));
    if (!filter_error.empty()) {
        errors.push_back(filter_error);
    }

    return errors;
}

MoverConfig Settings::to_config() const {
    MoverConfig config;
    config.source_dir = FileHelpers::expand_home(get_string("source_dir"));
    config.destination_dir = FileHelpers::expand_home(get_string("destination_dir"));
    config.stability_window = std::chrono::seconds(get_int("stability_wait", 5));
    config.scan_interval = std::chrono::seconds(get_int("scan_interval", 10));
    config.inactivity_threshold = std::chrono::minutes(get_int("inactivity_threshold_minutes", 5));
    config.health_check_interval = std::chrono::seconds(get_int("health_notification_interval", 3600));
    config.shutdown_grace = std::chrono::seconds(get_int("shutdown_grace", 10));
    config.load_sample_interval = std::chrono::seconds(get_int("load_sample_interval", 30));
    config.notification_rate_limit = std::chrono::seconds(get_int("notification_rate_limit", 30));
    config.verify_checksum = get_bool("verify_checksum", false);
    config.dry_run = get_bool("dry_run", false);
    config.file_filter = get_string("file_filter");
    config.max_bandwidth = static_cast<uint64_t>(std::max<int64_t>(0, get_int("max_bandwidth", 1048576)));
    config.max_workers = static_cast<int>(get_int("max_workers", 4));
    config.retry_attempts = static_cast<int>(get_int("retry_attempts", 5));
    config.backoff_base_seconds = get_double("backoff_base", 1.0);
    config.backoff_multiplier = get_double("backoff_multiplier", 2.0);
    config.progress_threshold_bytes =
        static_cast<uint64_t>(std::max<int64_t>(0, get_int("progress_tracking_threshold_bytes", 52428800)));
    return config;
}

std::string Settings::log_file() const {
    return FileHelpers::expand_home(get_string("log_file"));
}

std::string Settings::metrics_db() const {
    return FileHelpers::expand_home(get_string("metrics_db"));
}

std::string Settings::get_string(const std::string& key, const std::string& default_value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = settings_.find(key);
    if (it != settings_.end()) {
        return it->second;
    }
    return default_value;
}

void Settings::set_string(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[key] = value;
}

int64_t Settings::get_int(const std::string& key, int64_t default_value) const {
    int64_t value = 0;
    return parse_int64(get_string(key), value) ? value : default_value;
}

void Settings::set_int(const std::string& key, int64_t value) {
    set_string(key, std::to_string(value));
}

double Settings::get_double(const std::string& key, double default_value) const {
    double value = 0.0;
    return parse_double(get_string(key), value) ? value : default_value;
}

bool Settings::get_bool(const std::string& key, bool default_value) const {
    std::string str = get_string(key);
    if (str.empty()) return default_value;
    return (str == "true" || str == "1" || str == "yes");
}

void Settings::set_bool(const std::string& key, bool value) {
    set_string(key, value ? "true" : "false");
}

} // namespace filemover
