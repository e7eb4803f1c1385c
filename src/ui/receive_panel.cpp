#include "ui/receive_panel.hpp"
#include "ui/idle_updates.hpp"
#include "ui/widgets.hpp"
#include <filesystem>
#include <cstdio>

namespace fs = std::filesystem;

namespace ui {

ReceivePanel::ReceivePanel(GtkWindow* parent_window)
    : parent_window_(parent_window), save_dir_(networking::kDefaultReceiveDir) {

    panel_ = make_panel_box(12);
    gtk_box_append(GTK_BOX(panel_), make_label("Incoming transfers", "title-text"));
    gtk_box_append(GTK_BOX(panel_), make_address_row(&host_entry_, &port_entry_));

    GtkWidget* dir_row = make_row("section-box");
    save_label_ = make_label("Save to: " + fs::absolute(save_dir_).string(), nullptr);
    gtk_label_set_xalign(GTK_LABEL(save_label_), 0.0);
    gtk_label_set_ellipsize(GTK_LABEL(save_label_), PANGO_ELLIPSIZE_MIDDLE);
    gtk_widget_set_hexpand(save_label_, TRUE);
    gtk_box_append(GTK_BOX(dir_row), save_label_);
    gtk_box_append(GTK_BOX(dir_row), make_button("Change...", "flat", G_CALLBACK(on_change_dir_clicked), this));
    gtk_box_append(GTK_BOX(panel_), dir_row);

    GtkWidget* actions = make_row();
    gtk_widget_set_halign(actions, GTK_ALIGN_CENTER);
    start_button_ = make_button("Start Server", "suggested-action", G_CALLBACK(on_start_clicked), this);
    stop_button_ = make_button("Stop Server", "destructive-action", G_CALLBACK(on_stop_clicked), this);
    gtk_widget_set_sensitive(stop_button_, FALSE);
    gtk_box_append(GTK_BOX(actions), start_button_);
    gtk_box_append(GTK_BOX(actions), stop_button_);
    gtk_box_append(GTK_BOX(actions), make_button("Clear Log", "flat", G_CALLBACK(on_clear_log_clicked), this));
    gtk_box_append(GTK_BOX(panel_), actions);

    status_label_ = make_label("Server stopped", "status-text");
    gtk_label_set_ellipsize(GTK_LABEL(status_label_), PANGO_ELLIPSIZE_END);
    progress_bar_ = gtk_progress_bar_new();
    progress_label_ = make_label("", "status-text");
    log_view_ = make_log_view();
    gtk_box_append(GTK_BOX(panel_), status_label_);
    gtk_box_append(GTK_BOX(panel_), progress_bar_);
    gtk_box_append(GTK_BOX(panel_), progress_label_);
    gtk_box_append(GTK_BOX(panel_), make_scroller(log_view_, 160, true));
}

ReceivePanel::~ReceivePanel() {
    stop_server();
}

void ReceivePanel::log(const std::string& message) {
    append_log(log_view_, message);
}

void ReceivePanel::start_server() {
    // A previous server may have failed to bind; reap its thread first
    stop_server();

    std::string host = entry_text(host_entry_);
    unsigned short port = 0;
    if (host.empty()) {
        log("Error: Host must not be empty");
        return;
    }
    if (!parse_port_entry(port_entry_, port)) {
        log("Error: Port must be a number between 1 and 65535");
        return;
    }

    GtkWidget* status_lbl = status_label_;
    GtkWidget* progress_br = progress_bar_;
    GtkWidget* progress_lbl = progress_label_;
    GtkWidget* log_view = log_view_;
    GtkWidget* start_btn = start_button_;
    GtkWidget* stop_btn = stop_button_;

    networking::ServerCallbacks callbacks;
    callbacks.on_ready = [status_lbl, stop_btn](const std::string& bound_host, unsigned short bound_port) {
        post_label(status_lbl, "Listening on " + bound_host + ":" + std::to_string(bound_port));
        post_sensitive(stop_btn, true);
    };
    callbacks.on_status = [log_view](const std::string& msg) {
        post_log(log_view, msg);
    };
    callbacks.on_progress = [progress_br, progress_lbl](const std::string& filename, uint64_t received,
                                                        uint64_t total, double speed) {
        double frac = (total > 0) ? (static_cast<double>(received) / total) : 1.0;
        char buf[256];
        snprintf(buf, sizeof(buf), "%d%% | %.1f MB/s | %s", static_cast<int>(frac * 100), speed, filename.c_str());
        post_progress(progress_br, progress_lbl, frac, buf);
    };
    callbacks.on_complete = [log_view](const transfer::TransferResult& result) {
        if (result.ok()) {
            post_log(log_view, "✓ Received " + result.filename + " (" +
                                   networking::format_size(result.bytes_transferred) + ") -> " + result.path);
        } else {
            std::string name = result.filename.empty() ? std::string("<unknown>") : result.filename;
            post_log(log_view, "✗ Transfer of " + name + " failed [" + transfer::to_string(result.error) + "]: " +
                                   result.detail);
        }
    };
    callbacks.on_error = [log_view, status_lbl](const std::string& err) {
        post_log(log_view, "Error: " + err);
        post_label(status_lbl, "Server failed to start");
    };

    log("Starting server on " + host + ":" + std::to_string(port) + "...");
    gtk_widget_set_sensitive(start_button_, FALSE);
    gtk_widget_set_sensitive(host_entry_, FALSE);
    gtk_widget_set_sensitive(port_entry_, FALSE);
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0.0);
    gtk_label_set_text(GTK_LABEL(progress_label_), "");

    server_ = std::make_unique<networking::Server>(networking::ServerConfig{host, port, save_dir_}, callbacks);
    networking::Server* server = server_.get();
    GtkWidget* host_ent = host_entry_;
    GtkWidget* port_ent = port_entry_;

    server_thread_ = std::thread([server, start_btn, stop_btn, host_ent, port_ent, status_lbl]() {
        if (server->run()) {
            post_label(status_lbl, "Server stopped");
        }
        post_sensitive(stop_btn, false);
        post_sensitive(start_btn, true);
        post_sensitive(host_ent, true);
        post_sensitive(port_ent, true);
    });
}

void ReceivePanel::stop_server() {
    if (!server_) return;

    server_->stop();
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    server_.reset();
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void ReceivePanel::on_start_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<ReceivePanel*>(user_data)->start_server();
}

void ReceivePanel::on_stop_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    gtk_widget_set_sensitive(self->stop_button_, FALSE);
    std::size_t live = self->server_ ? self->server_->active_sessions() : 0;
    if (live > 0) {
        self->log("Stopping server, aborting " + std::to_string(live) + " transfer(s)...");
    } else {
        self->log("Stopping server...");
    }
    self->stop_server();
}

void ReceivePanel::on_change_dir_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* native = gtk_file_chooser_native_new(
        "Select save directory", self->parent_window_,
        GTK_FILE_CHOOSER_ACTION_SELECT_FOLDER, "_Select", "_Cancel");

    g_signal_connect(native, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        if (response == GTK_RESPONSE_ACCEPT) {
            auto* panel = static_cast<ReceivePanel*>(data);
            GFile* folder = gtk_file_chooser_get_file(GTK_FILE_CHOOSER(dialog));
            if (folder) {
                char* path = g_file_get_path(folder);
                if (path) {
                    panel->save_dir_ = path;
                    gtk_label_set_text(GTK_LABEL(panel->save_label_), (std::string("Save to: ") + path).c_str());
                    if (panel->server_ && panel->server_->is_running()) {
                        panel->log("New directory applies after the server restarts");
                    }
                    g_free(path);
                }
                g_object_unref(folder);
            }
        }
        g_object_unref(dialog);
    }), self);

    gtk_native_dialog_show(GTK_NATIVE_DIALOG(native));
G_GNUC_END_IGNORE_DEPRECATIONS
}

void ReceivePanel::on_clear_log_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<ReceivePanel*>(user_data);
    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(self->log_view_));
    gtk_text_buffer_set_text(buffer, "", -1);
}

} // namespace ui
