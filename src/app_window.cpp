#include "app_window.hpp"
#include "desktop_notifier.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "settings.hpp"

#include <filesystem>

#ifndef FERRY_DATA_DIR
#define FERRY_DATA_DIR "data"
#endif

namespace ferry {

namespace {

constexpr guint POLL_INTERVAL_MS = 200;

const char* severity_css_class(Severity severity) {
    switch (severity) {
        case Severity::Success: return "notification-success";
        case Severity::Warning: return "notification-warning";
        case Severity::Error:   return "notification-error";
        case Severity::Info:
        default:                return "notification-info";
    }
}

const char* severity_icon(Severity severity) {
    switch (severity) {
        case Severity::Success: return "emblem-ok-symbolic";
        case Severity::Warning: return "dialog-warning-symbolic";
        case Severity::Error:   return "dialog-error-symbolic";
        case Severity::Info:
        default:                return "dialog-information-symbolic";
    }
}

std::string entry_text(GtkWidget* entry) {
    const char* text = gtk_editable_get_text(GTK_EDITABLE(entry));
    return text ? std::string(text) : std::string();
}

} // namespace

AppWindow& AppWindow::getInstance() {
    static AppWindow instance;
    return instance;
}

bool AppWindow::initialize(GtkApplication* app, TransferEngine& engine) {
    if (window_) {
        return true; // Already initialized
    }
    engine_ = &engine;

    load_stylesheet();
    build_window();
    gtk_application_add_window(app, GTK_WINDOW(window_));

    auto& settings = SettingsManager::getInstance();
    set_source_folder(settings.get_last_source_folder());
    set_destination_folder(settings.get_last_destination_folder());

    poll_timeout_id_ = g_timeout_add(POLL_INTERVAL_MS, [](gpointer data) -> gboolean {
        static_cast<AppWindow*>(data)->poll();
        return G_SOURCE_CONTINUE;
    }, this);

    Logger::info("[AppWindow] Initialized with GTK4");
    return true;
}

void AppWindow::show() {
    if (!window_) return;
    gtk_widget_set_visible(window_, TRUE);
    gtk_window_present(GTK_WINDOW(window_));
}

void AppWindow::shutdown() {
    if (poll_timeout_id_ > 0) {
        g_source_remove(poll_timeout_id_);
        poll_timeout_id_ = 0;
    }
    engine_ = nullptr;
    Logger::debug("[AppWindow] Polling stopped");
}

void AppWindow::set_source_folder(const std::string& path) {
    if (source_entry_ && !path.empty()) {
        gtk_editable_set_text(GTK_EDITABLE(source_entry_), path.c_str());
    }
}

void AppWindow::set_destination_folder(const std::string& path) {
    if (destination_entry_ && !path.empty()) {
        gtk_editable_set_text(GTK_EDITABLE(destination_entry_), path.c_str());
    }
}

void AppWindow::load_stylesheet() {
    std::string css_path = std::string(FERRY_DATA_DIR) + "/ferry.css";
    if (!std::filesystem::exists(css_path)) {
        Logger::warn("[AppWindow] Stylesheet not found: " + css_path);
        return;
    }

    GtkCssProvider* css_provider = gtk_css_provider_new();
    gtk_css_provider_load_from_path(css_provider, css_path.c_str());
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(css_provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
    g_object_unref(css_provider);
    Logger::debug("[AppWindow] Loaded stylesheet " + css_path);
}

GtkWidget* AppWindow::build_folder_row(const char* caption, GtkWidget** entry, bool source) {
    GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);

    GtkWidget* label = gtk_label_new(caption);
    gtk_widget_add_css_class(label, "field-caption");
    gtk_widget_set_size_request(label, 90, -1);
    gtk_label_set_xalign(GTK_LABEL(label), 0);
    gtk_box_append(GTK_BOX(row), label);

    *entry = gtk_entry_new();
    gtk_widget_set_hexpand(*entry, TRUE);
    gtk_entry_set_placeholder_text(GTK_ENTRY(*entry), source ? "Folder to copy" : "Where to copy it");
    gtk_box_append(GTK_BOX(row), *entry);

    GtkWidget* browse = gtk_button_new_from_icon_name("folder-open-symbolic");
    gtk_widget_set_tooltip_text(browse, "Choose folder");
    g_object_set_data(G_OBJECT(browse), "is-source", GINT_TO_POINTER(source ? 1 : 0));
    g_signal_connect(browse, "clicked", G_CALLBACK(+[](GtkButton* btn, gpointer data) {
        bool is_source = GPOINTER_TO_INT(g_object_get_data(G_OBJECT(btn), "is-source")) != 0;
        static_cast<AppWindow*>(data)->on_choose_folder_clicked(is_source);
    }), this);
    gtk_box_append(GTK_BOX(row), browse);

    return row;
}

GtkWidget* AppWindow::build_slot(GtkWidget* grid, int row, const char* caption, const char* css_class) {
    GtkWidget* caption_label = gtk_label_new(caption);
    gtk_widget_add_css_class(caption_label, "slot-caption");
    gtk_label_set_xalign(GTK_LABEL(caption_label), 0);
    gtk_grid_attach(GTK_GRID(grid), caption_label, 0, row, 1, 1);

    GtkWidget* value = gtk_label_new("-");
    gtk_widget_add_css_class(value, css_class);
    gtk_widget_set_hexpand(value, TRUE);
    gtk_label_set_xalign(GTK_LABEL(value), 0);
    gtk_label_set_ellipsize(GTK_LABEL(value), PANGO_ELLIPSIZE_MIDDLE);
    gtk_grid_attach(GTK_GRID(grid), value, 1, row, 1, 1);
    return value;
}

void AppWindow::build_window() {
    window_ = gtk_window_new();
    gtk_window_set_title(GTK_WINDOW(window_), "Ferry");
    gtk_window_set_default_size(GTK_WINDOW(window_), 640, 420);

    g_signal_connect(window_, "close-request", G_CALLBACK(+[](GtkWindow*, gpointer) -> gboolean {
        GApplication* app = g_application_get_default();
        if (app) {
            g_application_quit(app);
        }
        return FALSE;
    }), nullptr);

    GtkWidget* overlay = gtk_overlay_new();
    gtk_window_set_child(GTK_WINDOW(window_), overlay);

    GtkWidget* content = gtk_box_new(GTK_ORIENTATION_VERTICAL, 12);
    gtk_widget_add_css_class(content, "content-area");
    gtk_widget_set_margin_start(content, 20);
    gtk_widget_set_margin_end(content, 20);
    gtk_widget_set_margin_top(content, 20);
    gtk_widget_set_margin_bottom(content, 20);
    gtk_overlay_set_child(GTK_OVERLAY(overlay), content);

    // ===== FOLDERS =====
    gtk_box_append(GTK_BOX(content), build_folder_row("Source", &source_entry_, true));
    gtk_box_append(GTK_BOX(content), build_folder_row("Destination", &destination_entry_, false));

    // ===== STATUS =====
    status_label_ = gtk_label_new("Choose a folder to copy");
    gtk_widget_add_css_class(status_label_, "status-label");
    gtk_label_set_xalign(GTK_LABEL(status_label_), 0);
    gtk_label_set_ellipsize(GTK_LABEL(status_label_), PANGO_ELLIPSIZE_END);
    gtk_box_append(GTK_BOX(content), status_label_);

    GtkWidget* grid = gtk_grid_new();
    gtk_grid_set_row_spacing(GTK_GRID(grid), 4);
    gtk_grid_set_column_spacing(GTK_GRID(grid), 12);
    folder_label_ = build_slot(grid, 0, "Folder", "folder-label");
    files_label_ = build_slot(grid, 1, "Files", "files-label");
    size_label_ = build_slot(grid, 2, "Size", "size-label");
    speed_label_ = build_slot(grid, 3, "Speed", "speed-label");
    elapsed_label_ = build_slot(grid, 5, "Elapsed", "elapsed-label");

    // ETA row carries the decorative image beside the value
    GtkWidget* eta_caption = gtk_label_new("Remaining");
    gtk_widget_add_css_class(eta_caption, "slot-caption");
    gtk_label_set_xalign(GTK_LABEL(eta_caption), 0);
    gtk_grid_attach(GTK_GRID(grid), eta_caption, 0, 4, 1, 1);

    GtkWidget* eta_box = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
    eta_image_ = gtk_image_new_from_icon_name("alarm-symbolic");
    gtk_widget_add_css_class(eta_image_, "eta-image");
    gtk_widget_set_visible(eta_image_, FALSE);
    gtk_box_append(GTK_BOX(eta_box), eta_image_);
    eta_label_ = gtk_label_new("--:--:--");
    gtk_widget_add_css_class(eta_label_, "eta-label");
    gtk_label_set_xalign(GTK_LABEL(eta_label_), 0);
    gtk_box_append(GTK_BOX(eta_box), eta_label_);
    gtk_grid_attach(GTK_GRID(grid), eta_box, 1, 4, 1, 1);

    gtk_box_append(GTK_BOX(content), grid);

    // ===== PROGRESS =====
    progress_bar_ = gtk_progress_bar_new();
    gtk_widget_add_css_class(progress_bar_, "transfer-progress");
    gtk_progress_bar_set_show_text(GTK_PROGRESS_BAR(progress_bar_), TRUE);
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(progress_bar_), "0%");
    gtk_box_append(GTK_BOX(content), progress_bar_);

    // ===== CONTROLS =====
    GtkWidget* buttons = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    gtk_widget_set_halign(buttons, GTK_ALIGN_END);

    start_btn_ = gtk_button_new_with_label("Start");
    gtk_widget_add_css_class(start_btn_, "suggested-action");
    g_signal_connect(start_btn_, "clicked", G_CALLBACK(+[](GtkButton*, gpointer data) {
        static_cast<AppWindow*>(data)->on_start_clicked();
    }), this);

    pause_btn_ = gtk_button_new_with_label("Pause");
    gtk_widget_set_sensitive(pause_btn_, FALSE);
    g_signal_connect(pause_btn_, "clicked", G_CALLBACK(+[](GtkButton*, gpointer data) {
        static_cast<AppWindow*>(data)->on_pause_clicked();
    }), this);

    cancel_btn_ = gtk_button_new_with_label("Cancel");
    gtk_widget_add_css_class(cancel_btn_, "destructive-action");
    gtk_widget_set_sensitive(cancel_btn_, FALSE);
    g_signal_connect(cancel_btn_, "clicked", G_CALLBACK(+[](GtkButton*, gpointer data) {
        static_cast<AppWindow*>(data)->on_cancel_clicked();
    }), this);

    gtk_box_append(GTK_BOX(buttons), pause_btn_);
    gtk_box_append(GTK_BOX(buttons), cancel_btn_);
    gtk_box_append(GTK_BOX(buttons), start_btn_);
    gtk_box_append(GTK_BOX(content), buttons);

    build_notification_overlay(overlay);
}

void AppWindow::build_notification_overlay(GtkWidget* overlay) {
    notification_box_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_add_css_class(notification_box_, "notification-stack");
    gtk_widget_set_halign(notification_box_, GTK_ALIGN_END);
    gtk_widget_set_valign(notification_box_, GTK_ALIGN_START);
    gtk_widget_set_margin_top(notification_box_, 12);
    gtk_widget_set_margin_end(notification_box_, 12);
    gtk_overlay_add_overlay(GTK_OVERLAY(overlay), notification_box_);
}

void AppWindow::on_choose_folder_clicked(bool source) {
    G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkWidget* dialog = gtk_file_chooser_dialog_new(
        source ? "Select Folder to Copy" : "Select Destination Folder",
        GTK_WINDOW(window_),
        GTK_FILE_CHOOSER_ACTION_SELECT_FOLDER,
        "_Cancel", GTK_RESPONSE_CANCEL,
        "_Select", GTK_RESPONSE_ACCEPT,
        nullptr
    );
    G_GNUC_END_IGNORE_DEPRECATIONS

    g_object_set_data(G_OBJECT(dialog), "app_window", this);
    g_object_set_data(G_OBJECT(dialog), "is-source", GINT_TO_POINTER(source ? 1 : 0));

    g_signal_connect(dialog, "response", G_CALLBACK(+[](GtkDialog* dlg, gint response, gpointer) {
        auto* self = static_cast<AppWindow*>(g_object_get_data(G_OBJECT(dlg), "app_window"));
        bool is_source = GPOINTER_TO_INT(g_object_get_data(G_OBJECT(dlg), "is-source")) != 0;

        if (response == GTK_RESPONSE_ACCEPT && self) {
            G_GNUC_BEGIN_IGNORE_DEPRECATIONS
            GFile* file = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dlg));
            G_GNUC_END_IGNORE_DEPRECATIONS
            if (file) {
                char* path = g_file_get_path(file);
                if (path) {
                    if (is_source) {
                        self->set_source_folder(path);
                    } else {
                        self->set_destination_folder(path);
                    }
                    g_free(path);
                }
                g_object_unref(file);
            }
        }
        gtk_window_destroy(GTK_WINDOW(dlg));
    }), nullptr);

    gtk_widget_set_visible(dialog, TRUE);
}

void AppWindow::on_start_clicked() {
    if (!engine_) return;

    std::string source = entry_text(source_entry_);
    std::string destination = entry_text(destination_entry_);
    if (source.empty() || destination.empty()) {
        gtk_label_set_text(GTK_LABEL(status_label_), "Choose a source and a destination folder");
        return;
    }

    auto& settings = SettingsManager::getInstance();
    settings.set_last_source_folder(source);
    settings.set_last_destination_folder(destination);
    settings.save();

    // A finished job is dropped once the user moves on
    if (current_job_ != 0) {
        engine_->acknowledge(current_job_);
    }

    try {
        current_job_ = engine_->start(JobRequest{source, destination});
        last_status_ = JobStatus::Pending;
        Logger::info("[AppWindow] Started job " + std::to_string(current_job_));
        update_controls(JobStatus::Pending);
    } catch (const TransferError& e) {
        Logger::error("[AppWindow] Could not start copy: " + std::string(e.what()));
        gtk_label_set_text(GTK_LABEL(status_label_), e.what());
    }
}

void AppWindow::on_pause_clicked() {
    if (!engine_ || current_job_ == 0) return;

    auto snap = engine_->snapshot(current_job_);
    if (!snap) return;

    if (snap->status == JobStatus::Paused) {
        engine_->resume(current_job_);
        gtk_button_set_label(GTK_BUTTON(pause_btn_), "Pause");
    } else if (engine_->pause(current_job_)) {
        gtk_button_set_label(GTK_BUTTON(pause_btn_), "Resume");
    }
}

void AppWindow::on_cancel_clicked() {
    if (!engine_ || current_job_ == 0) return;
    if (engine_->cancel(current_job_)) {
        gtk_widget_set_sensitive(cancel_btn_, FALSE);
    }
}

void AppWindow::update_controls(JobStatus status) {
    bool active = !is_terminal(status);
    gtk_widget_set_sensitive(start_btn_, !active);
    gtk_widget_set_sensitive(pause_btn_, active);
    gtk_widget_set_sensitive(cancel_btn_, active);
    gtk_widget_set_visible(eta_image_, status == JobStatus::Running);
    if (!active || status == JobStatus::Pending) {
        gtk_button_set_label(GTK_BUTTON(pause_btn_), "Pause");
    }
}

void AppWindow::poll() {
    if (!engine_) return;

    engine_->expire_notifications();
    render_notifications();

    if (current_job_ == 0) return;
    auto snap = engine_->snapshot(current_job_);
    if (!snap) return;

    render_progress(*snap);

    if (snap->status != last_status_) {
        update_controls(snap->status);
        if (is_terminal(snap->status)) {
            on_job_finished(*snap);
        }
        last_status_ = snap->status;
    }
}

void AppWindow::render_progress(const AggregateProgress& progress) {
    gtk_label_set_text(GTK_LABEL(status_label_), progress.status_text.c_str());
    gtk_label_set_text(GTK_LABEL(folder_label_), progress.current_folder.c_str());
    gtk_label_set_text(GTK_LABEL(files_label_), progress.files_text().c_str());
    gtk_label_set_text(GTK_LABEL(size_label_), progress.size_text().c_str());
    gtk_label_set_text(GTK_LABEL(speed_label_), progress.speed_text().c_str());
    gtk_label_set_text(GTK_LABEL(eta_label_), progress.eta_text().c_str());
    gtk_label_set_text(GTK_LABEL(elapsed_label_), progress.elapsed_text().c_str());

    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), progress.percent / 100.0);
    std::string pct = std::to_string(progress.percent) + "%";
    gtk_progress_bar_set_text(GTK_PROGRESS_BAR(progress_bar_), pct.c_str());
}

void AppWindow::render_notifications() {
    auto visible = engine_->visible_notifications();

    std::vector<NotificationId> ids;
    ids.reserve(visible->size());
    for (const auto& n : *visible) {
        ids.push_back(n.id);
    }
    if (ids == rendered_notifications_) return;
    rendered_notifications_ = ids;

    GtkWidget* child = gtk_widget_get_first_child(notification_box_);
    while (child) {
        GtkWidget* next = gtk_widget_get_next_sibling(child);
        gtk_box_remove(GTK_BOX(notification_box_), child);
        child = next;
    }

    for (const auto& n : *visible) {
        GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
        gtk_widget_add_css_class(row, "elegant-notification");
        gtk_widget_add_css_class(row, severity_css_class(n.severity));

        GtkWidget* icon = gtk_image_new_from_icon_name(severity_icon(n.severity));
        gtk_box_append(GTK_BOX(row), icon);

        GtkWidget* label = gtk_label_new(n.message.c_str());
        gtk_widget_add_css_class(label, "notification-text");
        gtk_label_set_wrap(GTK_LABEL(label), TRUE);
        gtk_label_set_max_width_chars(GTK_LABEL(label), 40);
        gtk_label_set_xalign(GTK_LABEL(label), 0);
        gtk_widget_set_hexpand(label, TRUE);
        gtk_box_append(GTK_BOX(row), label);

        GtkWidget* close = gtk_button_new_from_icon_name("window-close-symbolic");
        gtk_widget_add_css_class(close, "flat");
        gtk_widget_add_css_class(close, "circular");
        g_object_set_data_full(G_OBJECT(close), "notification-id", new NotificationId(n.id),
                               +[](gpointer p) { delete static_cast<NotificationId*>(p); });
        g_signal_connect(close, "clicked", G_CALLBACK(+[](GtkButton* btn, gpointer data) {
            auto* self = static_cast<AppWindow*>(data);
            auto* id = static_cast<NotificationId*>(g_object_get_data(G_OBJECT(btn), "notification-id"));
            if (self->engine_ && id) {
                self->engine_->dismiss(*id);
                self->render_notifications();
            }
        }), this);
        gtk_box_append(GTK_BOX(row), close);

        gtk_box_append(GTK_BOX(notification_box_), row);
    }
}

void AppWindow::on_job_finished(const AggregateProgress& progress) {
    Logger::info("[AppWindow] Job " + std::to_string(progress.job_id) + " finished: " +
                 progress.status_text);

    if (gtk_window_is_active(GTK_WINDOW(window_))) return;

    Notification n;
    n.job_id = progress.job_id;
    n.message = progress.status_text;
    switch (progress.status) {
        case JobStatus::Completed:
            n.severity = progress.files_skipped > 0 ? Severity::Warning : Severity::Success;
            break;
        case JobStatus::Failed:
            n.severity = Severity::Error;
            break;
        default:
            n.severity = Severity::Info;
            break;
    }
    DesktopNotifier::getInstance().notify_job_finished(n);
}

} // namespace ferry
