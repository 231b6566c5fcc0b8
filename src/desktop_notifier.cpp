#include "desktop_notifier.hpp"
#include "logger.hpp"

namespace ferry {

DesktopNotifier& DesktopNotifier::getInstance() {
    static DesktopNotifier instance;
    return instance;
}

void DesktopNotifier::init(GApplication* app) {
    app_ = app;
    if (app_) {
        Logger::info("[Notifications] Desktop notifier initialized");
    }
}

std::string DesktopNotifier::get_icon_for_severity(Severity severity) const {
    switch (severity) {
        case Severity::Success:
            return "emblem-ok-symbolic";
        case Severity::Warning:
            return "dialog-warning-symbolic";
        case Severity::Error:
            return "dialog-error-symbolic";
        case Severity::Info:
        default:
            return "folder-copy-symbolic";
    }
}

void DesktopNotifier::notify(const std::string& title, const std::string& body,
                             Severity severity) {
    if (!enabled_ || !app_) {
        Logger::debug("[Notifications] Desktop notification skipped: " + title);
        return;
    }

    GNotification* notification = g_notification_new(title.c_str());
    g_notification_set_body(notification, body.c_str());

    GIcon* icon = g_themed_icon_new(get_icon_for_severity(severity).c_str());
    g_notification_set_icon(notification, icon);

    switch (severity) {
        case Severity::Error:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_URGENT);
            break;
        case Severity::Warning:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_HIGH);
            break;
        default:
            g_notification_set_priority(notification, G_NOTIFICATION_PRIORITY_NORMAL);
            break;
    }

    // One slot per application: a newer outcome replaces the previous one
    g_application_send_notification(app_, "ferry-job", notification);

    g_object_unref(icon);
    g_object_unref(notification);

    Logger::info("[Notifications] Sent: " + title);
}

void DesktopNotifier::notify_job_finished(const Notification& notification) {
    const char* title = "Copy Finished";
    switch (notification.severity) {
        case Severity::Success: title = "Copy Complete"; break;
        case Severity::Warning: title = "Copy Finished with Errors"; break;
        case Severity::Error:   title = "Copy Failed"; break;
        case Severity::Info:    title = "Copy"; break;
    }
    notify(title, notification.message, notification.severity);
}

} // namespace ferry
