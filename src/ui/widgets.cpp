#include "ui/widgets.hpp"
#include "networking.hpp"
#include <stdexcept>

namespace ui {

GtkWidget* make_panel_box(int margin) {
    GtkWidget* box = gtk_box_new(GTK_ORIENTATION_VERTICAL, 8);
    gtk_widget_set_margin_start(box, margin);
    gtk_widget_set_margin_end(box, margin);
    gtk_widget_set_margin_top(box, margin);
    gtk_widget_set_margin_bottom(box, margin);
    return box;
}

GtkWidget* make_row(const char* css_class) {
    GtkWidget* row = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 8);
    if (css_class) gtk_widget_add_css_class(row, css_class);
    return row;
}

GtkWidget* make_label(const std::string& text, const char* css_class) {
    GtkWidget* label = gtk_label_new(text.c_str());
    if (css_class) gtk_widget_add_css_class(label, css_class);
    return label;
}

GtkWidget* make_button(const char* text, const char* css_class, GCallback on_clicked, gpointer user_data) {
    GtkWidget* button = gtk_button_new_with_label(text);
    if (css_class) gtk_widget_add_css_class(button, css_class);
    g_signal_connect(button, "clicked", on_clicked, user_data);
    return button;
}

GtkWidget* make_entry(const std::string& initial, int width_chars) {
    GtkWidget* entry = gtk_entry_new();
    gtk_editable_set_text(GTK_EDITABLE(entry), initial.c_str());
    if (width_chars > 0) {
        gtk_editable_set_width_chars(GTK_EDITABLE(entry), width_chars);
    } else {
        gtk_widget_set_hexpand(entry, TRUE);
    }
    return entry;
}

GtkWidget* make_log_view() {
    GtkWidget* view = gtk_text_view_new();
    gtk_text_view_set_editable(GTK_TEXT_VIEW(view), FALSE);
    gtk_text_view_set_cursor_visible(GTK_TEXT_VIEW(view), FALSE);
    gtk_text_view_set_monospace(GTK_TEXT_VIEW(view), TRUE);
    gtk_text_view_set_wrap_mode(GTK_TEXT_VIEW(view), GTK_WRAP_WORD_CHAR);
    return view;
}

GtkWidget* make_scroller(GtkWidget* child, int min_height, bool expand) {
    GtkWidget* scroller = gtk_scrolled_window_new();
    gtk_scrolled_window_set_policy(GTK_SCROLLED_WINDOW(scroller), GTK_POLICY_NEVER, GTK_POLICY_AUTOMATIC);
    gtk_scrolled_window_set_min_content_height(GTK_SCROLLED_WINDOW(scroller), min_height);
    gtk_widget_set_vexpand(scroller, expand ? TRUE : FALSE);
    gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(scroller), child);
    return scroller;
}

GtkWidget* make_address_row(GtkWidget** host_entry, GtkWidget** port_entry) {
    GtkWidget* row = make_row("section-box");
    *host_entry = make_entry(networking::kDefaultHost);
    *port_entry = make_entry(std::to_string(networking::kDefaultPort), 6);

    gtk_box_append(GTK_BOX(row), gtk_label_new("Host:"));
    gtk_box_append(GTK_BOX(row), *host_entry);
    gtk_box_append(GTK_BOX(row), gtk_label_new("Port:"));
    gtk_box_append(GTK_BOX(row), *port_entry);
    return row;
}

std::string entry_text(GtkWidget* entry) {
    return gtk_editable_get_text(GTK_EDITABLE(entry));
}

bool parse_port_entry(GtkWidget* entry, unsigned short& port) {
    std::string text = entry_text(entry);
    try {
        size_t used = 0;
        unsigned long parsed = std::stoul(text, &used);
        if (used != text.size() || parsed == 0 || parsed > 65535) return false;
        port = static_cast<unsigned short>(parsed);
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

} // namespace ui
