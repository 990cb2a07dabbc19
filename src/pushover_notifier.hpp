#pragma once

#include "notifications.hpp"

#include <string>
#include <vector>

namespace filemover {

/**
 * Pushover notifications over libcurl.
 *
 * One POST to the messages API per selected device, or a single untargeted
 * POST (all of the user's devices) when no device is selected.
 */
class PushoverNotifier : public NotificationSink {
public:
    static constexpr const char* MESSAGES_URL = "https://api.pushover.net/1/messages.json";
    static constexpr const char* VALIDATE_URL = "https://api.pushover.net/1/users/validate.json";

    PushoverNotifier(std::string app_token, std::string user_key, std::vector<std::string> devices);
    ~PushoverNotifier() override;

    PushoverNotifier(const PushoverNotifier&) = delete;
    PushoverNotifier& operator=(const PushoverNotifier&) = delete;

    // Checks the token/user pair against the validate endpoint
    bool verify();

    bool notify(const std::string& message, const std::string& title,
                NotificationType type = NotificationType::INFO) override;

    // Splits "a, b,,c" into {"a", "b", "c"}
    static std::vector<std::string> parse_devices(const std::string& list);

private:
    bool post(const std::string& url, const std::string& body, std::string& response);
    std::string build_message_body(const std::string& message, const std::string& title,
                                   NotificationType type, const std::string& device) const;

    std::string app_token_;
    std::string user_key_;
    std::vector<std::string> devices_;
    long timeout_seconds_ = 10;
};

} // namespace filemover
