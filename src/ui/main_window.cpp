#include "ui/main_window.hpp"
#include "ui/file_sender.hpp"
#include "ui/receive_panel.hpp"

namespace ui {

static const char* CSS_STYLE = R"(
window {
    background-color: #1d2327;
}

headerbar {
    background-color: #263238;
    color: #eceff1;
    border-bottom: 1px solid #37474f;
}

stackswitcher button {
    color: #b0bec5;
    background: transparent;
    border: none;
    border-radius: 6px;
    padding: 6px 14px;
}

stackswitcher button:checked {
    background-color: #00897b;
    color: white;
}

.drop-zone {
    background-color: #263238;
    border: 2px dashed #4db6ac;
    border-radius: 12px;
    padding: 32px;
}

.section-box {
    background-color: #263238;
    border-radius: 8px;
    padding: 10px;
}

.title-text {
    color: #eceff1;
    font-size: 17px;
    font-weight: bold;
}

.subtitle-text {
    color: #78909c;
    font-size: 12px;
}

.status-text {
    color: #b0bec5;
    font-size: 13px;
}

.file-item {
    padding: 6px 10px;
    color: #cfd8dc;
}

label {
    color: #cfd8dc;
}

button.suggested-action {
    background-color: #00897b;
    color: white;
    border-radius: 6px;
    padding: 6px 18px;
}

button.destructive-action {
    background-color: #c62828;
    color: white;
    border-radius: 6px;
    padding: 6px 18px;
}

progressbar progress {
    background-color: #4db6ac;
    min-height: 8px;
}

textview, textview text {
    background-color: #151a1d;
    color: #cfd8dc;
}
)";

void MainWindow::setup_css() {
    GtkCssProvider* provider = gtk_css_provider_new();
    gtk_css_provider_load_from_string(provider, CSS_STYLE);
    gtk_style_context_add_provider_for_display(
        gdk_display_get_default(),
        GTK_STYLE_PROVIDER(provider),
        GTK_STYLE_PROVIDER_PRIORITY_APPLICATION
    );
    g_object_unref(provider);
}

void MainWindow::on_destroy(GtkWidget* /*widget*/, gpointer data) {
    // Owned by the window; released together with it
    delete static_cast<MainWindow*>(data);
}

MainWindow::MainWindow(GtkApplication* app) {
    setup_css();

    window_ = gtk_application_window_new(app);
    gtk_window_set_title(GTK_WINDOW(window_), "AckDrop");
    gtk_window_set_default_size(GTK_WINDOW(window_), 560, 680);

    header_bar_ = gtk_header_bar_new();
    gtk_window_set_titlebar(GTK_WINDOW(window_), header_bar_);

    stack_ = gtk_stack_new();
    gtk_stack_set_transition_type(GTK_STACK(stack_), GTK_STACK_TRANSITION_TYPE_CROSSFADE);

    send_panel_ = new FileSenderPanel(GTK_WINDOW(window_));
    receive_panel_ = new ReceivePanel(GTK_WINDOW(window_));

    gtk_stack_add_titled(GTK_STACK(stack_), send_panel_->get_widget(), "send", "Send Files");
    gtk_stack_add_titled(GTK_STACK(stack_), receive_panel_->get_widget(), "receive", "Receive Files");

    GtkWidget* switcher = gtk_stack_switcher_new();
    gtk_stack_switcher_set_stack(GTK_STACK_SWITCHER(switcher), GTK_STACK(stack_));
    gtk_header_bar_set_title_widget(GTK_HEADER_BAR(header_bar_), switcher);

    gtk_window_set_child(GTK_WINDOW(window_), stack_);

    g_signal_connect(window_, "destroy", G_CALLBACK(on_destroy), this);

    gtk_window_present(GTK_WINDOW(window_));
}

MainWindow::~MainWindow() {
    // Stops the listener and joins its thread before the widgets go away
    delete receive_panel_;
    delete send_panel_;
}

static void activate_callback(GtkApplication* app, gpointer /*user_data*/) {
    new MainWindow(app);
}

int run_gui(int argc, char* argv[]) {
    GtkApplication* app = gtk_application_new("dev.ackdrop.app", G_APPLICATION_DEFAULT_FLAGS);
    g_signal_connect(app, "activate", G_CALLBACK(activate_callback), nullptr);
    int status = g_application_run(G_APPLICATION(app), argc, argv);
    g_object_unref(app);
    return status;
}

} // namespace ui
