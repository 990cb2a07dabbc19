#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <gio/gio.h>

namespace filemover {

enum class NotificationType {
    INFO,
    WARNING,
    ERROR
};

/**
 * Receiver of (message, title) notifications.
 * Delivery failures are logged by the sink and never retried.
 */
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    // Returns true if the notification was handed to the transport
    virtual bool notify(const std::string& message, const std::string& title,
                        NotificationType type = NotificationType::INFO) = 0;
};

/**
 * Notification Manager
 *
 * Fans each notification out to every registered sink. Notifications that
 * arrive less than rate_limit after the previous delivered one are dropped
 * (and logged), so a burst of failures produces a single alert.
 */
class NotificationManager : public NotificationSink {
public:
    explicit NotificationManager(std::chrono::seconds rate_limit = std::chrono::seconds(0));

    void add_sink(std::shared_ptr<NotificationSink> sink);
    size_t sink_count() const;

    bool notify(const std::string& message, const std::string& title,
                NotificationType type = NotificationType::INFO) override;

    size_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<NotificationSink>> sinks_;
    std::chrono::seconds rate_limit_;
    std::chrono::steady_clock::time_point last_sent_;
    bool has_sent_ = false;
    size_t dropped_ = 0;
};

/**
 * Desktop notifications through GNotification (GIO)
 */
class DesktopNotifier : public NotificationSink {
public:
    // app must outlive the notifier; nullptr disables delivery
    explicit DesktopNotifier(GApplication* app);

    bool notify(const std::string& message, const std::string& title,
                NotificationType type = NotificationType::INFO) override;

private:
    static const char* icon_for_type(NotificationType type);

    GApplication* app_ = nullptr;
};

} // namespace filemover
