#pragma once

#include <gtk/gtk.h>
#include <string>
#include <vector>

#include "notification_queue.hpp"
#include "transfer_engine.hpp"

namespace ferry {

/**
 * Main Application Window (GTK4)
 *
 * Progress view for one copy job at a time:
 * - Source folder chooser and destination folder
 * - Status, folder, files, size, ETA and elapsed slots
 * - Progress bar and Start / Pause / Cancel controls
 * - Notification overlay stacked over the progress view
 *
 * The window polls the engine; it never waits on the worker thread.
 */
class AppWindow {
public:
    static AppWindow& getInstance();

    /**
     * Build the window and start polling the engine
     * @return true on success
     */
    bool initialize(GtkApplication* app, TransferEngine& engine);

    GtkWidget* get_window() const { return window_; }

    void show();

    /**
     * Stop polling and forget the engine.
     * Must be called before the engine is destroyed.
     */
    void shutdown();

    // Used by ferry --source/--destination to prefill the form
    void set_source_folder(const std::string& path);
    void set_destination_folder(const std::string& path);

private:
    AppWindow() = default;
    ~AppWindow() = default;

    AppWindow(const AppWindow&) = delete;
    AppWindow& operator=(const AppWindow&) = delete;

    // Build helpers
    void load_stylesheet();
    void build_window();
    GtkWidget* build_folder_row(const char* caption, GtkWidget** entry, bool source);
    GtkWidget* build_slot(GtkWidget* grid, int row, const char* caption, const char* css_class);
    void build_notification_overlay(GtkWidget* overlay);

    // Button handlers
    void on_choose_folder_clicked(bool source);
    void on_start_clicked();
    void on_pause_clicked();
    void on_cancel_clicked();

    // Polling
    void poll();
    void render_progress(const AggregateProgress& progress);
    void render_notifications();
    void update_controls(JobStatus status);
    void on_job_finished(const AggregateProgress& progress);

    TransferEngine* engine_ = nullptr;
    JobId current_job_ = 0;
    JobStatus last_status_ = JobStatus::Pending;
    guint poll_timeout_id_ = 0;

    GtkWidget* window_ = nullptr;
    GtkWidget* source_entry_ = nullptr;
    GtkWidget* destination_entry_ = nullptr;

    // Progress slots
    GtkWidget* status_label_ = nullptr;
    GtkWidget* folder_label_ = nullptr;
    GtkWidget* files_label_ = nullptr;
    GtkWidget* size_label_ = nullptr;
    GtkWidget* eta_label_ = nullptr;
    GtkWidget* eta_image_ = nullptr;
    GtkWidget* elapsed_label_ = nullptr;
    GtkWidget* speed_label_ = nullptr;
    GtkWidget* progress_bar_ = nullptr;

    GtkWidget* start_btn_ = nullptr;
    GtkWidget* pause_btn_ = nullptr;
    GtkWidget* cancel_btn_ = nullptr;

    // Notification overlay
    GtkWidget* notification_box_ = nullptr;
    std::vector<NotificationId> rendered_notifications_;
};

} // namespace ferry
