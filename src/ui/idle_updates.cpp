#include "ui/idle_updates.hpp"

namespace ui {

// ─── Idle callback data structs ─────────────────────────────────────────────

struct LabelUpdateData {
    GtkWidget* label;
    std::string text;
};

struct ProgressUpdateData {
    GtkWidget* progress_bar;
    GtkWidget* progress_label;
    double fraction;
    std::string text;
};

struct LogUpdateData {
    GtkWidget* view;
    std::string line;
};

struct SensitiveUpdateData {
    GtkWidget* widget;
    bool sensitive;
};

// ─── Idle callbacks (run on main thread) ────────────────────────────────────

static gboolean update_label_idle(gpointer data) {
    auto* d = static_cast<LabelUpdateData*>(data);
    if (GTK_IS_LABEL(d->label))
        gtk_label_set_text(GTK_LABEL(d->label), d->text.c_str());
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean update_progress_idle(gpointer data) {
    auto* d = static_cast<ProgressUpdateData*>(data);
    if (GTK_IS_PROGRESS_BAR(d->progress_bar))
        gtk_progress_bar_set_fraction(GTK_PROGRESS_BAR(d->progress_bar), d->fraction);
    if (GTK_IS_LABEL(d->progress_label))
        gtk_label_set_text(GTK_LABEL(d->progress_label), d->text.c_str());
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean update_log_idle(gpointer data) {
    auto* d = static_cast<LogUpdateData*>(data);
    append_log(d->view, d->line);
    delete d;
    return G_SOURCE_REMOVE;
}

static gboolean update_sensitive_idle(gpointer data) {
    auto* d = static_cast<SensitiveUpdateData*>(data);
    if (GTK_IS_WIDGET(d->widget))
        gtk_widget_set_sensitive(d->widget, d->sensitive ? TRUE : FALSE);
    delete d;
    return G_SOURCE_REMOVE;
}

void post_label(GtkWidget* label, const std::string& text) {
    g_idle_add(update_label_idle, new LabelUpdateData{label, text});
}

void post_progress(GtkWidget* progress_bar, GtkWidget* progress_label, double fraction, const std::string& text) {
    g_idle_add(update_progress_idle, new ProgressUpdateData{progress_bar, progress_label, fraction, text});
}

void post_log(GtkWidget* text_view, const std::string& line) {
    g_idle_add(update_log_idle, new LogUpdateData{text_view, line});
}

void post_sensitive(GtkWidget* widget, bool sensitive) {
    g_idle_add(update_sensitive_idle, new SensitiveUpdateData{widget, sensitive});
}

void append_log(GtkWidget* text_view, const std::string& line) {
    if (!GTK_IS_TEXT_VIEW(text_view)) return;
    GtkTextBuffer* buffer = gtk_text_view_get_buffer(GTK_TEXT_VIEW(text_view));
    GtkTextIter end;
    gtk_text_buffer_get_end_iter(buffer, &end);
    std::string text = line + "\n";
    gtk_text_buffer_insert(buffer, &end, text.c_str(), -1);

    gtk_text_buffer_get_end_iter(buffer, &end);
    GtkTextMark* mark = gtk_text_buffer_create_mark(buffer, nullptr, &end, FALSE);
    gtk_text_view_scroll_mark_onscreen(GTK_TEXT_VIEW(text_view), mark);
    gtk_text_buffer_delete_mark(buffer, mark);
}

} // namespace ui
