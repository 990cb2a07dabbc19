#include "notifications.hpp"
#include "logger.hpp"

namespace filemover {

NotificationManager::NotificationManager(std::chrono::seconds rate_limit)
    : rate_limit_(rate_limit) {
}

void NotificationManager::add_sink(std::shared_ptr<NotificationSink> sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

size_t NotificationManager::sink_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

size_t NotificationManager::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

bool NotificationManager::notify(const std::string& message, const std::string& title,
                                 NotificationType type) {
    std::vector<std::shared_ptr<NotificationSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (has_sent_ && now - last_sent_ < rate_limit_) {
            dropped_++;
            Logger::info("[Notifications] Rate limited: " + title);
            return false;
        }
        last_sent_ = now;
        has_sent_ = true;
        sinks = sinks_;
    }

    if (sinks.empty()) {
        Logger::debug("[Notifications] No sinks, skipped: " + title);
        return false;
    }

    bool delivered = false;
    for (const auto& sink : sinks) {
        try {
            delivered = sink->notify(message, title, type) || delivered;
        } catch (const std::exception& e) {
            Logger::error("[Notifications] Sink failed for '" + title + "': " + e.what());
        }
    }
    return delivered;
}

DesktopNotifier::DesktopNotifier(GApplication* app) : app_(app) {
    if (app_) {
        Logger::info("[Notifications] Desktop notifications enabled");
    }
}

const char* DesktopNotifier::icon_for_type(NotificationType type) {
    switch (type) {
        case NotificationType::WARNING:
            return "dialog-warning-symbolic";
        case NotificationType::ERROR:
            return "dialog-error-symbolic";
        case NotificationType::INFO:
        default:
            return "folder-download-symbolic";
    }
}

bool DesktopNotifier::notify(const std::string& message, const std::string& title,
                             NotificationType type) {
    if (!app_) {
        Logger::debug("[Notifications] Desktop skipped: " + title);
        return false;
    }

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, message.c_str());

    GIcon* icon = g_themed_icon_new(icon_for_type(type));
    g_notification_set_icon(notification, icon);

    switch (type) {
        case NotificationType::ERROR:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_URGENT);
            break;
        case NotificationType::WARNING:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_HIGH);
            break;
        default:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_NORMAL);
            break;
    }

    std::string notification_id = "filemover-" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    g_application_send_notification(app_, notification_id.c_str(), notification);

    g_object_unref(icon);
    g_object_unref(notification);

    Logger::info("[Notifications] Sent: " + title);
    return true;
}

} // namespace filemover
