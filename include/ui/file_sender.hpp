#pragma once

#include <gtk/gtk.h>
#include "networking.hpp"
#include <vector>
#include <string>
#include <thread>
#include <atomic>

namespace ui {

class FileSenderPanel {
public:
    explicit FileSenderPanel(GtkWindow* parent_window);
    ~FileSenderPanel();

    GtkWidget* get_widget() const { return panel_; }

private:
    GtkWidget* panel_;
    GtkWidget* host_entry_;
    GtkWidget* port_entry_;
    GtkWidget* drop_area_;
    GtkWidget* drop_label_;
    GtkWidget* file_list_box_;
    GtkWidget* send_button_;
    GtkWidget* clear_button_;
    GtkWidget* remove_button_;
    GtkWidget* choose_file_button_;
    GtkWidget* status_label_;
    GtkWidget* progress_bar_;
    GtkWidget* progress_label_;
    GtkWidget* log_view_;
    GtkWindow* parent_window_;

    std::vector<std::string> queued_files_;
    std::thread send_thread_;
    std::atomic<bool> sending_{false};

    void add_path(const std::string& path);
    void clear_files();
    void remove_selected();
    void start_sending();
    void update_file_list_ui();
    void show_error(const std::string& message);

    static void on_choose_file(GtkButton* button, gpointer user_data);
    static void on_send_clicked(GtkButton* button, gpointer user_data);
    static void on_clear_clicked(GtkButton* button, gpointer user_data);
    static void on_remove_clicked(GtkButton* button, gpointer user_data);
    static gboolean on_drop(GtkDropTarget* target, const GValue* value,
                            double x, double y, gpointer user_data);
};

} // namespace ui
