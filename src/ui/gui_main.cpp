#include "ui/main_window.hpp"

int main(int argc, char* argv[]) {
    return ui::run_gui(argc, argv);
}
