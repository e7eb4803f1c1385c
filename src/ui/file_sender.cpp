#include "ui/file_sender.hpp"
#include "ui/idle_updates.hpp"
#include "ui/widgets.hpp"
#include <filesystem>
#include <algorithm>
#include <functional>
#include <cstdio>

namespace fs = std::filesystem;

namespace ui {

namespace {

const char* kIdleHint = "Ready to send files...";

std::string rate_text(const std::string& filename, uint64_t done, uint64_t total, double speed) {
    int percent = (total > 0) ? static_cast<int>((done * 100.0) / total) : 100;
    char buf[256];
    snprintf(buf, sizeof(buf), "%s: %d%% of %s | %.1f MB/s", filename.c_str(), percent,
             networking::format_size(total).c_str(), speed);
    return buf;
}

} // namespace

FileSenderPanel::FileSenderPanel(GtkWindow* parent_window)
    : parent_window_(parent_window) {

    panel_ = make_panel_box(12);
    gtk_box_append(GTK_BOX(panel_), make_address_row(&host_entry_, &port_entry_));

    // Drop zone doubles as the queue summary
    drop_area_ = gtk_box_new(GTK_ORIENTATION_VERTICAL, 6);
    gtk_widget_add_css_class(drop_area_, "drop-zone");
    drop_label_ = make_label("Drop files or folders here", "title-text");
    gtk_box_append(GTK_BOX(drop_area_), drop_label_);
    gtk_box_append(GTK_BOX(drop_area_), make_label("Folders are sent file by file", "subtitle-text"));
    gtk_box_append(GTK_BOX(panel_), drop_area_);

    GtkDropTarget* target = gtk_drop_target_new(GDK_TYPE_FILE_LIST, GDK_ACTION_COPY);
    g_signal_connect(target, "drop", G_CALLBACK(on_drop), this);
    gtk_widget_add_controller(drop_area_, GTK_EVENT_CONTROLLER(target));

    file_list_box_ = gtk_list_box_new();
    gtk_list_box_set_selection_mode(GTK_LIST_BOX(file_list_box_), GTK_SELECTION_MULTIPLE);
    gtk_box_append(GTK_BOX(panel_), make_scroller(file_list_box_, 120, true));

    GtkWidget* actions = make_row();
    gtk_widget_set_halign(actions, GTK_ALIGN_CENTER);
    choose_file_button_ = make_button("Add Files...", "suggested-action", G_CALLBACK(on_choose_file), this);
    remove_button_ = make_button("Remove", "flat", G_CALLBACK(on_remove_clicked), this);
    clear_button_ = make_button("Clear", "destructive-action", G_CALLBACK(on_clear_clicked), this);
    send_button_ = make_button("Send", "suggested-action", G_CALLBACK(on_send_clicked), this);
    gtk_widget_set_sensitive(send_button_, FALSE);
    for (GtkWidget* button : {choose_file_button_, remove_button_, clear_button_, send_button_}) {
        gtk_box_append(GTK_BOX(actions), button);
    }
    gtk_box_append(GTK_BOX(panel_), actions);

    status_label_ = make_label(kIdleHint, "status-text");
    gtk_label_set_ellipsize(GTK_LABEL(status_label_), PANGO_ELLIPSIZE_END);
    progress_bar_ = gtk_progress_bar_new();
    progress_label_ = make_label("", "status-text");
    log_view_ = make_log_view();
    gtk_box_append(GTK_BOX(panel_), status_label_);
    gtk_box_append(GTK_BOX(panel_), progress_bar_);
    gtk_box_append(GTK_BOX(panel_), progress_label_);
    gtk_box_append(GTK_BOX(panel_), make_scroller(log_view_, 80, false));
}

FileSenderPanel::~FileSenderPanel() {
    // A stalled peer may keep the batch alive; it only touches widgets through idle callbacks
    if (send_thread_.joinable()) {
        send_thread_.detach();
    }
}

void FileSenderPanel::add_path(const std::string& path) {
    auto enqueue = [this](const std::string& file) {
        if (std::find(queued_files_.begin(), queued_files_.end(), file) == queued_files_.end()) {
            queued_files_.push_back(file);
        }
    };

    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        for (fs::recursive_directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) enqueue(it->path().string());
        }
    } else if (fs::is_regular_file(path, ec)) {
        enqueue(path);
    }
    if (ec) {
        append_log(log_view_, "Skipped " + path + ": " + ec.message());
    }
    update_file_list_ui();
}

void FileSenderPanel::clear_files() {
    queued_files_.clear();
    update_file_list_ui();
}

void FileSenderPanel::remove_selected() {
    std::vector<int> rows;
    GList* selected = gtk_list_box_get_selected_rows(GTK_LIST_BOX(file_list_box_));
    for (GList* it = selected; it; it = it->next) {
        rows.push_back(gtk_list_box_row_get_index(GTK_LIST_BOX_ROW(it->data)));
    }
    g_list_free(selected);

    // Highest index first so the rest stay valid
    std::sort(rows.begin(), rows.end(), std::greater<int>());
    for (int row : rows) {
        if (row >= 0 && static_cast<size_t>(row) < queued_files_.size()) {
            queued_files_.erase(queued_files_.begin() + row);
        }
    }
    update_file_list_ui();
}

void FileSenderPanel::update_file_list_ui() {
    gtk_list_box_remove_all(GTK_LIST_BOX(file_list_box_));

    uint64_t total = 0;
    for (const auto& file : queued_files_) {
        std::error_code ec;
        uint64_t size = fs::file_size(file, ec);
        std::string row = fs::path(file).filename().string();
        if (!ec) {
            total += size;
            row += "  ·  " + networking::format_size(size);
        }

        GtkWidget* label = make_label(row, "file-item");
        gtk_label_set_xalign(GTK_LABEL(label), 0.0);
        gtk_widget_set_tooltip_text(label, file.c_str());
        gtk_list_box_append(GTK_LIST_BOX(file_list_box_), label);
    }

    std::string summary = queued_files_.empty()
                              ? std::string("Drop files or folders here")
                              : std::to_string(queued_files_.size()) + " queued, " + networking::format_size(total);
    gtk_label_set_text(GTK_LABEL(drop_label_), summary.c_str());
    gtk_widget_set_sensitive(send_button_, !queued_files_.empty() && !sending_);
}

void FileSenderPanel::show_error(const std::string& message) {
    gtk_label_set_text(GTK_LABEL(status_label_), message.c_str());
    append_log(log_view_, "Error: " + message);
}

void FileSenderPanel::start_sending() {
    if (queued_files_.empty() || sending_) return;

    std::string host = entry_text(host_entry_);
    unsigned short port = 0;
    if (host.empty()) {
        show_error("Host must not be empty");
        return;
    }
    if (!parse_port_entry(port_entry_, port)) {
        show_error("Port must be a number between 1 and 65535");
        return;
    }

    // The previous batch has already cleared sending_
    if (send_thread_.joinable()) {
        send_thread_.join();
    }

    sending_ = true;
    for (GtkWidget* w : {send_button_, clear_button_, remove_button_}) {
        gtk_widget_set_sensitive(w, FALSE);
    }
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(progress_bar_), 0.0);
    gtk_label_set_text(GTK_LABEL(status_label_), ("Sending to " + host + ":" + std::to_string(port)).c_str());

    // Widgets are captured by pointer; every update goes through the idle helpers
    GtkWidget* status = status_label_;
    GtkWidget* bar = progress_bar_;
    GtkWidget* bar_text = progress_label_;
    GtkWidget* log = log_view_;
    std::vector<GtkWidget*> controls = {send_button_, clear_button_, remove_button_};

    networking::ClientCallbacks callbacks;
    callbacks.on_status = [status](const std::string& text) { post_label(status, text); };
    callbacks.on_progress = [bar, bar_text](const std::string& name, uint64_t done, uint64_t total, double speed) {
        double fraction = (total > 0) ? static_cast<double>(done) / total : 1.0;
        post_progress(bar, bar_text, fraction, rate_text(name, done, total, speed));
    };
    callbacks.on_complete = [log](const transfer::TransferResult& result) {
        std::string name = fs::path(result.path).filename().string();
        post_log(log, result.ok() ? "Sent " + name + " (" + networking::format_size(result.bytes_transferred) + ")"
                                  : "Failed " + name + ": " + result.detail);
    };

    std::vector<std::string> batch = queued_files_;
    std::atomic<bool>* sending = &sending_;
    send_thread_ = std::thread([host, port, batch, callbacks, sending, status, controls]() {
        std::vector<transfer::TransferResult> results = networking::send_files(host, port, batch, callbacks);

        auto ok = std::count_if(results.begin(), results.end(),
                                [](const transfer::TransferResult& r) { return r.ok(); });
        post_label(status, "Done: " + std::to_string(ok) + " of " + std::to_string(batch.size()) + " file(s) sent");
        *sending = false;
        for (GtkWidget* w : controls) post_sensitive(w, true);
    });
}

// ─── GTK Callbacks ──────────────────────────────────────────────────────────

void FileSenderPanel::on_choose_file(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<FileSenderPanel*>(user_data);

G_GNUC_BEGIN_IGNORE_DEPRECATIONS
    GtkFileChooserNative* chooser = gtk_file_chooser_native_new(
        "Add files", self->parent_window_, GTK_FILE_CHOOSER_ACTION_OPEN, "_Add", "_Cancel");
    gtk_file_chooser_set_select_multiple(GTK_FILE_CHOOSER(chooser), TRUE);

    g_signal_connect(chooser, "response", G_CALLBACK(+[](GtkNativeDialog* dialog, int response, gpointer data) {
        if (response == GTK_RESPONSE_ACCEPT) {
            auto* panel = static_cast<FileSenderPanel*>(data);
            GListModel* chosen = gtk_file_chooser_get_files(GTK_FILE_CHOOSER(dialog));
            guint count = g_list_model_get_n_items(chosen);
            for (guint i = 0; i < count; ++i) {
                GFile* file = G_FILE(g_list_model_get_item(chosen, i));
                if (char* path = g_file_get_path(file)) {
                    panel->add_path(path);
                    g_free(path);
                }
                g_object_unref(file);
            }
            g_object_unref(chosen);
        }
        g_object_unref(dialog);
    }), self);

    gtk_native_dialog_show(GTK_NATIVE_DIALOG(chooser));
G_GNUC_END_IGNORE_DEPRECATIONS
}

void FileSenderPanel::on_send_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<FileSenderPanel*>(user_data)->start_sending();
}

void FileSenderPanel::on_clear_clicked(GtkButton* /*button*/, gpointer user_data) {
    auto* self = static_cast<FileSenderPanel*>(user_data);
    self->clear_files();
    gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(self->progress_bar_), 0.0);
    gtk_label_set_text(GTK_LABEL(self->progress_label_), "");
    gtk_label_set_text(GTK_LABEL(self->status_label_), kIdleHint);
}

void FileSenderPanel::on_remove_clicked(GtkButton* /*button*/, gpointer user_data) {
    static_cast<FileSenderPanel*>(user_data)->remove_selected();
}

gboolean FileSenderPanel::on_drop(GtkDropTarget* /*target*/, const GValue* value,
                                  double /*x*/, double /*y*/, gpointer user_data) {
    auto* self = static_cast<FileSenderPanel*>(user_data);
    if (self->sending_ || !G_VALUE_HOLDS(value, GDK_TYPE_FILE_LIST)) {
        return FALSE;
    }

    GSList* dropped = gdk_file_list_get_files(static_cast<GdkFileList*>(g_value_get_boxed(value)));
    for (GSList* it = dropped; it; it = it->next) {
        if (char* path = g_file_get_path(G_FILE(it->data))) {
            self->add_path(path);
            g_free(path);
        }
    }
    g_slist_free(dropped);
    return TRUE;
}

} // namespace ui
