#include "../catalog.hpp"
#include <linux/input.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include "live_monitor.hpp"

// ncurses redefines KEY_MAX, so size the evdev key bitmap explicitly
constexpr int EVDEV_KEY_COUNT = 0x300;

LiveMonitor::LiveMonitor(InputSource& device, const Config& config)
    : device(device), config(config), running(false), device_lost(false) {
    init_ncurses();

    int screen_height, screen_width;
    getmaxyx(stdscr, screen_height, screen_width);
    main_win = std::make_unique<Window>(screen_height, screen_width, 0, 0, "xpadcfg monitor", true);
}

LiveMonitor::~LiveMonitor() {
    main_win.reset();
    endwin();
}

void LiveMonitor::init_ncurses() {
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    timeout(50); // 50ms timeout for getch

    // Disable XON/XOFF flow control so Ctrl+S reaches the app
    struct termios term;
    tcgetattr(STDIN_FILENO, &term);
    term.c_iflag &= ~(IXON | IXOFF);
    tcsetattr(STDIN_FILENO, TCSANOW, &term);

    init_color_pairs();
}

void LiveMonitor::poll_device() {
    // The ioctls below report current state; the queue only needs emptying
    InputEvent ev;
    int rc;
    while ((rc = device.read_event(ev)) == 0) {
    }
    if (rc != -EAGAIN) {
        device_lost = true;
    }
}

void LiveMonitor::draw_axes_panel(int start_col, int panel_width, int start_row, int max_row) {
    Window* win = main_win.get();

    int label_width = std::max(16, (panel_width - 12) * 40 / 100);
    int col_bar = start_col + label_width;
    int bar_width = std::max(10, panel_width - label_width - 10);
    int col_value = col_bar + bar_width + 1;

    win->print(start_row - 1, start_col - 2, "Axes", A_BOLD | A_UNDERLINE);
    int row = start_row;

    for (const auto& slot : axis_catalog()) {
        if (row >= max_row) break;

        std::string label = std::string(slot.name) + " " + slot.label;
        mvwprintw(win->get(), row, start_col, "%-*s", label_width, label.c_str());

        const AxisBinding* binding = config.axes.find(slot.name);
        struct input_absinfo absinfo_buf;
        if (!binding || device_lost || ioctl(device.get_fd(), EVIOCGABS(binding->code), &absinfo_buf) != 0) {
            wattron(win->get(), A_DIM);
            mvwprintw(win->get(), row, col_bar, "%s", binding ? "(no data)" : "(unmapped)");
            wattroff(win->get(), A_DIM);
            row++;
            continue;
        }

        float percent = 0.0f;
        if (absinfo_buf.maximum > absinfo_buf.minimum) {
            percent = std::clamp(static_cast<float>(absinfo_buf.value - absinfo_buf.minimum) /
                                 (absinfo_buf.maximum - absinfo_buf.minimum), 0.0f, 1.0f);
        }
        if (binding->inverted) {
            percent = 1.0f - percent;
        }

        win->draw_bar(row, col_bar, bar_width, percent);
        mvwprintw(win->get(), row, col_value, "%6d", absinfo_buf.value);
        row++;
    }
}

void LiveMonitor::draw_buttons_panel(int start_col, int panel_width, int start_row, int max_row) {
    Window* win = main_win.get();

    const int state_width = 9; // "[PRESSED]"
    int usable = std::min(panel_width, 40);
    int col_state = start_col + usable - state_width;
    int name_max = std::max(6, col_state - start_col - 1);

    win->print(start_row - 1, start_col - 1, "Buttons", A_BOLD | A_UNDERLINE);
    int row = start_row;

    unsigned char key_state[EVDEV_KEY_COUNT / 8];
    memset(key_state, 0, sizeof(key_state));
    bool have_state = !device_lost && ioctl(device.get_fd(), EVIOCGKEY(sizeof(key_state)), key_state) >= 0;

    for (const auto& slot : button_catalog()) {
        if (row >= max_row) break;

        std::string btn_name = slot.label;
        if (static_cast<int>(btn_name.length()) > name_max - 2)
            btn_name = btn_name.substr(0, name_max - 5) + "...";
        int blen = static_cast<int>(btn_name.length());

        mvwprintw(win->get(), row, start_col, "%s", btn_name.c_str());

        // Dot leaders filling gap to state column
        int dots = name_max - blen;
        if (dots > 0) {
            wattron(win->get(), A_DIM);
            mvwprintw(win->get(), row, start_col + blen, "%s", std::string(dots, '.').c_str());
            wattroff(win->get(), A_DIM);
        }

        auto code = config.buttons.code_for(slot.name);
        bool pressed = code && have_state && *code >= 0 && *code < EVDEV_KEY_COUNT &&
                       (key_state[*code / 8] & (1 << (*code % 8)));

        if (!code) {
            wattron(win->get(), A_DIM);
            mvwprintw(win->get(), row, col_state, " unmapped");
            wattroff(win->get(), A_DIM);
        } else if (pressed) {
            wattron(win->get(), COLOR_PAIR(CP_ONLINE) | A_BOLD);
            mvwprintw(win->get(), row, col_state, "[PRESSED]");
            wattroff(win->get(), COLOR_PAIR(CP_ONLINE) | A_BOLD);
        } else {
            wattron(win->get(), A_DIM);
            mvwprintw(win->get(), row, col_state, "    -    ");
            wattroff(win->get(), A_DIM);
        }

        row++;
    }
}

void LiveMonitor::draw() {
    int height = main_win->get_height();
    int width = main_win->get_width();

    main_win->clear_contents();

    main_win->print(1, 2, device.name() + " (" + device.get_path() + ")", COLOR_PAIR(CP_HEADER) | A_BOLD);

    main_win->print(2, 2, "Status: ", 0);
    if (device_lost) {
        wattron(main_win->get(), COLOR_PAIR(CP_OFFLINE));
        wprintw(main_win->get(), "DISCONNECTED");
        wattroff(main_win->get(), COLOR_PAIR(CP_OFFLINE));
    } else {
        wattron(main_win->get(), COLOR_PAIR(CP_ONLINE));
        wprintw(main_win->get(), "MONITORING");
        wattroff(main_win->get(), COLOR_PAIR(CP_ONLINE));
    }

    int divider = width / 2;
    int max_row = height - 3;

    draw_axes_panel(4, divider - 6, 5, max_row);

    for (int r = 4; r < height - 3; r++)
        mvwaddch(main_win->get(), r, divider - 1, ACS_VLINE | COLOR_PAIR(CP_BORDER) | A_DIM);

    draw_buttons_panel(divider + 2, width - divider - 4, 5, max_row);

    main_win->print(height - 2, 2, "[q] Quit", A_DIM);
    main_win->update();
}

void LiveMonitor::run() {
    running = true;
    while (running) {
        if (!device_lost) {
            poll_device();
        }
        draw();

        int ch = getch();
        if (ch == 'q' || ch == 'Q' || ch == 27) {
            running = false;
        }
    }
}
