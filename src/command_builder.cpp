#include "command_builder.hpp"
#include <sstream>

std::string CommandBuilder::format_keymap(const ButtonMapping& buttons) {
    std::string s;
    for (const auto& binding : buttons.bindings) {
        if (!s.empty()) s += ",";
        s += binding.key_name + "=" + binding.button;
    }
    return s;
}

std::string CommandBuilder::format_absmap(const AxisMapping& axes) {
    std::string s;
    for (const auto& binding : axes.bindings) {
        if (!s.empty()) s += ",";
        s += binding.axis_name + "=" + binding.axis;
    }
    return s;
}

std::string CommandBuilder::format_axismap(const AxisMapping& axes) {
    std::string s;
    for (const auto& binding : axes.bindings) {
        if (!binding.inverted) continue;
        if (!s.empty()) s += ",";
        s += "-" + binding.axis + "=" + binding.axis;
    }
    return s;
}

std::string CommandBuilder::build(const ButtonMapping& buttons, const AxisMapping& axes) const {
    std::ostringstream cmd;
    cmd << program << " --evdev " << DEVICE_PLACEHOLDER;

    // Empty groups are left out so no flag goes without its value
    std::string keymap = format_keymap(buttons);
    if (!keymap.empty()) cmd << " --evdev-keymap " << keymap;

    std::string absmap = format_absmap(axes);
    if (!absmap.empty()) cmd << " --evdev-absmap " << absmap;

    std::string axismap = format_axismap(axes);
    if (!axismap.empty()) cmd << " --axismap " << axismap;

    cmd << " --mimic-xpad --silent";
    return cmd.str();
}
