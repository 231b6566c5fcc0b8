#pragma once

#include <string>
#include <gio/gio.h>

#include "notification_queue.hpp"

namespace ferry {

/**
 * Desktop Notifications
 *
 * Forwards job outcomes to the desktop shell through GNotification (GIO),
 * for when the main window is not in front.
 */
class DesktopNotifier {
public:
    static DesktopNotifier& getInstance();

    // Initialize with GApplication for notifications
    void init(GApplication* app);

    void notify(const std::string& title, const std::string& body,
                Severity severity = Severity::Info);

    // Sends a terminal job notification with a title matching its severity
    void notify_job_finished(const Notification& notification);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool is_enabled() const { return enabled_; }

private:
    DesktopNotifier() = default;
    ~DesktopNotifier() = default;

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    std::string get_icon_for_severity(Severity severity) const;

    GApplication* app_ = nullptr;
    bool enabled_ = true;
};

} // namespace ferry
