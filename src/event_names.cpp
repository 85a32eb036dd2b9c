#include "event_names.hpp"
#include <linux/input.h>
#include <linux/input-event-codes.h>
#include <libevdev-1.0/libevdev/libevdev.h>

std::string key_name(int code) {
    const char* name = libevdev_event_code_get_name(EV_KEY, code);
    return name ? name : ("KEY_#" + std::to_string(code));
}

std::string axis_name(int code) {
    const char* name = libevdev_event_code_get_name(EV_ABS, code);
    return name ? name : ("ABS_#" + std::to_string(code));
}
