#pragma once

#include <gtk/gtk.h>
#include "networking.hpp"
#include <memory>
#include <string>
#include <thread>

namespace ui {

class ReceivePanel {
public:
    explicit ReceivePanel(GtkWindow* parent_window);
    ~ReceivePanel();

    GtkWidget* get_widget() const { return panel_; }

    void start_server();
    void stop_server();

private:
    GtkWidget* panel_;
    GtkWidget* host_entry_;
    GtkWidget* port_entry_;
    GtkWidget* save_label_;
    GtkWidget* start_button_;
    GtkWidget* stop_button_;
    GtkWidget* status_label_;
    GtkWidget* progress_bar_;
    GtkWidget* progress_label_;
    GtkWidget* log_view_;
    GtkWindow* parent_window_;
    std::string save_dir_;

    std::unique_ptr<networking::Server> server_;
    std::thread server_thread_;

    void log(const std::string& message);

    static void on_start_clicked(GtkButton* button, gpointer user_data);
    static void on_stop_clicked(GtkButton* button, gpointer user_data);
    static void on_change_dir_clicked(GtkButton* button, gpointer user_data);
    static void on_clear_log_clicked(GtkButton* button, gpointer user_data);
};

} // namespace ui
