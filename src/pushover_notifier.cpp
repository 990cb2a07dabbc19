#include "pushover_notifier.hpp"
#include "logger.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>
#include <sstream>

namespace filemover {

namespace {

std::once_flag curl_init_flag;

size_t write_to_string(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

std::string escape(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) return "";
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace

PushoverNotifier::PushoverNotifier(std::string app_token, std::string user_key, std::vector<std::string> devices)
    : app_token_(std::move(app_token))
    , user_key_(std::move(user_key))
    , devices_(std::move(devices)) {
    std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
    Logger::info("[Pushover] Enabled for " +
                 (devices_.empty() ? std::string("all devices") : std::to_string(devices_.size()) + " device(s)"));
}

PushoverNotifier::~PushoverNotifier() = default;

std::vector<std::string> PushoverNotifier::parse_devices(const std::string& list) {
    std::vector<std::string> devices;
    std::istringstream iss(list);
    std::string item;
    while (std::getline(iss, item, ',')) {
        auto start = item.find_first_not_of(" \t");
        auto end = item.find_last_not_of(" \t");
        if (start == std::string::npos) continue;
        devices.push_back(item.substr(start, end - start + 1));
    }
    return devices;
}

bool PushoverNotifier::post(const std::string& url, const std::string& body, std::string& response) {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        Logger::error("[Pushover] curl_easy_init failed");
        return false;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        Logger::error("[Pushover] Request failed: " + std::string(curl_easy_strerror(rc)));
        return false;
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status != 200) {
        Logger::error("[Pushover] HTTP " + std::to_string(status) + ": " + response);
        return false;
    }
    return true;
}

std::string PushoverNotifier::build_message_body(const std::string& message, const std::string& title,
                                                 NotificationType type, const std::string& device) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return "";

    std::string body = "token=" + escape(curl.get(), app_token_) +
                       "&user=" + escape(curl.get(), user_key_) +
                       "&title=" + escape(curl.get(), title) +
                       "&message=" + escape(curl.get(), message);
    if (!device.empty()) {
        body += "&device=" + escape(curl.get(), device);
    }
    if (type == NotificationType::ERROR) {
        body += "&priority=1";
    }
    return body;
}

bool PushoverNotifier::verify() {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) return false;
    std::string body = "token=" + escape(curl.get(), app_token_) + "&user=" + escape(curl.get(), user_key_);

    std::string response;
    if (!post(VALIDATE_URL, body, response)) {
        Logger::error("[Pushover] Credential verification failed");
        return false;
    }
    Logger::info("[Pushover] Credentials verified");
    return true;
}

bool PushoverNotifier::notify(const std::string& message, const std::string& title, NotificationType type) {
    std::vector<std::string> targets = devices_;
    if (targets.empty()) {
        targets.push_back("");
    }

    bool any_sent = false;
    for (const auto& device : targets) {
        std::string body = build_message_body(message, title, type, device);
        if (body.empty()) {
            Logger::error("[Pushover] Cannot build request for: " + title);
            continue;
        }
        std::string response;
        if (post(MESSAGES_URL, body, response)) {
            Logger::info("[Pushover] Sent to " + (device.empty() ? std::string("all devices") : device) + ": " + title);
            any_sent = true;
        }
    }
    return any_sent;
}

} // namespace filemover
