#include "catalog.hpp"

const std::vector<ButtonSlot>& button_catalog() {
    static const std::vector<ButtonSlot> buttons = {
        {"start",  "Start"},
        {"back",   "Back"},
        {"guide",  "Guide"},
        {"a",      "A"},
        {"b",      "B"},
        {"x",      "X"},
        {"y",      "Y"},
        {"black",  "Black"},
        {"white",  "White"},
        {"lb",     "Left Bumper"},
        {"rb",     "Right Bumper"},
        {"lt",     "Left Trigger (digital)"},
        {"rt",     "Right Trigger (digital)"},
        {"tl",     "Left Stick Click"},
        {"tr",     "Right Stick Click"},
        {"du",     "D-Pad Up"},
        {"dd",     "D-Pad Down"},
        {"dl",     "D-Pad Left"},
        {"dr",     "D-Pad Right"},
        {"green",  "Guitar Green"},
        {"red",    "Guitar Red"},
        {"yellow", "Guitar Yellow"},
        {"blue",   "Guitar Blue"},
        {"orange", "Guitar Orange"}
    };
    return buttons;
}

const std::vector<AxisSlot>& axis_catalog() {
    // Stick Y rows are down-first: the emulator reads stick Y with the
    // opposite polarity to evdev, so a stock pad must come out inverted.
    static const std::vector<AxisSlot> axes = {
        {"x1",     "Left Stick X",  AxisShape::Bidirectional,  {"left", "right"}},
        {"y1",     "Left Stick Y",  AxisShape::Bidirectional,  {"down", "up"}},
        {"x2",     "Right Stick X", AxisShape::Bidirectional,  {"left", "right"}},
        {"y2",     "Right Stick Y", AxisShape::Bidirectional,  {"down", "up"}},
        {"lt",     "Left Trigger",  AxisShape::Unidirectional, {"press", nullptr}},
        {"rt",     "Right Trigger", AxisShape::Unidirectional, {"press", nullptr}},
        {"dpad_x", "D-Pad X",       AxisShape::Bidirectional,  {"left", "right"}},
        {"dpad_y", "D-Pad Y",       AxisShape::Bidirectional,  {"up", "down"}}
    };
    return axes;
}

std::string button_label(const std::string& name) {
    for (const auto& slot : button_catalog()) {
        if (name == slot.name) return slot.label;
    }
    return name;
}

std::string axis_label(const std::string& name) {
    for (const auto& slot : axis_catalog()) {
        if (name == slot.name) return slot.label;
    }
    return name;
}
