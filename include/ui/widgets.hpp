#pragma once

#include <gtk/gtk.h>
#include <string>

namespace ui {

// Small constructors shared by the panels

GtkWidget* make_panel_box(int margin);
GtkWidget* make_row(const char* css_class = nullptr);
GtkWidget* make_label(const std::string& text, const char* css_class);
GtkWidget* make_button(const char* text, const char* css_class, GCallback on_clicked, gpointer user_data);
GtkWidget* make_entry(const std::string& initial, int width_chars = -1);
GtkWidget* make_log_view();

// Wraps child in a vertical scroller
GtkWidget* make_scroller(GtkWidget* child, int min_height, bool expand);

// "Host: [....] Port: [....]" row; returns the row and fills both entries
GtkWidget* make_address_row(GtkWidget** host_entry, GtkWidget** port_entry);

std::string entry_text(GtkWidget* entry);

// Parses a port entry; 0 and out of range values are rejected
bool parse_port_entry(GtkWidget* entry, unsigned short& port);

} // namespace ui
