#pragma once

/**
 * xpadcfg live monitor
 *
 * Shows a controller through the saved mapping: every catalog button and
 * axis under its emulator name, driven by the raw evdev events.
 */

#include <string>
#include <algorithm>

// Last: ncurses defines function-like macros such as move() and erase()
#include <ncurses.h>

// Color pairs
enum ColorPairs {
    CP_DEFAULT = 1,
    CP_HEADER,
    CP_ONLINE,
    CP_OFFLINE,
    CP_WARNING,
    CP_AXIS,
    CP_BORDER
};

inline void init_color_pairs() {
    if (!has_colors()) return;

    start_color();
    use_default_colors();

    init_pair(CP_DEFAULT, COLOR_WHITE, -1);
    init_pair(CP_HEADER, COLOR_CYAN, -1);
    init_pair(CP_ONLINE, COLOR_GREEN, -1);
    init_pair(CP_OFFLINE, COLOR_RED, -1);
    init_pair(CP_WARNING, COLOR_YELLOW, -1);
    init_pair(CP_AXIS, COLOR_BLUE, -1);
    init_pair(CP_BORDER, COLOR_WHITE, -1);
}

// Window management helper
class Window {
private:
    WINDOW* win;
    int width, height;
    std::string title;
    bool has_border;

public:
    Window(int h, int w, int starty, int startx, const std::string& t = "", bool border = true)
        : win(newwin(h, w, starty, startx)), width(w), height(h), title(t), has_border(border) {
        draw_frame();
    }

    ~Window() {
        if (win) delwin(win);
    }

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    WINDOW* get() { return win; }

    void update() { wrefresh(win); }
    void clear_contents() { werase(win); draw_frame(); }

    void print(int row, int col, const std::string& text, int attrs = 0) {
        if (attrs) wattron(win, attrs);
        mvwprintw(win, row, col, "%s", text.c_str());
        if (attrs) wattroff(win, attrs);
    }

    void draw_bar(int row, int col, int bar_width, float percent) {
        int filled = std::clamp(static_cast<int>(bar_width * percent), 0, bar_width);
        std::string bar(filled, '#');
        bar += std::string(bar_width - filled, '-');

        wattron(win, COLOR_PAIR(CP_AXIS));
        mvwprintw(win, row, col, "%s", bar.c_str());
        wattroff(win, COLOR_PAIR(CP_AXIS));
    }

    int get_height() const { return height; }
    int get_width() const { return width; }

private:
    void draw_frame() {
        if (!has_border) return;
        box(win, 0, 0);
        if (!title.empty()) {
            wattron(win, COLOR_PAIR(CP_BORDER) | A_BOLD);
            mvwprintw(win, 0, 2, " %s ", title.c_str());
            wattroff(win, COLOR_PAIR(CP_BORDER) | A_BOLD);
        }
    }
};
