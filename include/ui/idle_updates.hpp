#pragma once

#include <gtk/gtk.h>
#include <string>

namespace ui {

// Thread-safe widget updates: each call queues the change on the GTK main loop
void post_label(GtkWidget* label, const std::string& text);
void post_progress(GtkWidget* progress_bar, GtkWidget* progress_label, double fraction, const std::string& text);
void post_log(GtkWidget* text_view, const std::string& line);
void post_sensitive(GtkWidget* widget, bool sensitive);

// Main thread only
void append_log(GtkWidget* text_view, const std::string& line);

} // namespace ui
