#pragma once

#include <string>

#include "mapping.hpp"

// Token the emulate mode replaces with the selected device path
constexpr const char* DEVICE_PLACEHOLDER = "{device}";

class CommandBuilder {
public:
    explicit CommandBuilder(std::string program = "xboxdrv") : program(std::move(program)) {}

    // <program> --evdev {device} [--evdev-keymap ...] [--evdev-absmap ...]
    //           [--axismap ...] --mimic-xpad --silent
    std::string build(const ButtonMapping& buttons, const AxisMapping& axes) const;

    static std::string format_keymap(const ButtonMapping& buttons);
    static std::string format_absmap(const AxisMapping& axes);
    static std::string format_axismap(const AxisMapping& axes);

private:
    std::string program;
};
