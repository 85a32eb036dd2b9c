#pragma once

#include <memory>

#include "../config.hpp"
#include "../input_source.hpp"
#include "tui_common.hpp"

class LiveMonitor {
private:
    InputSource& device;
    const Config& config;
    std::unique_ptr<Window> main_win;
    bool running;
    bool device_lost;

    void init_ncurses();
    void poll_device();
    void draw();
    void draw_axes_panel(int start_col, int panel_width, int start_row, int max_row);
    void draw_buttons_panel(int start_col, int panel_width, int start_row, int max_row);

public:
    LiveMonitor(InputSource& device, const Config& config);
    ~LiveMonitor();

    LiveMonitor(const LiveMonitor&) = delete;
    LiveMonitor& operator=(const LiveMonitor&) = delete;

    // Returns when the user presses q or Esc. A device that goes away stays
    // on screen as DISCONNECTED until then.
    void run();
};
