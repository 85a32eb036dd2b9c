#pragma once

#include <string>
#include <vector>
#include <optional>

// One canonical button bound to a physical key
struct ButtonBinding {
    std::string button;
    int code;
    std::string key_name;
};

struct AxisBinding {
    std::string axis;
    int code;
    std::string axis_name;
    bool inverted = false;
};

// Bindings in the order they were collected. Each physical key code
// appears at most once.
struct ButtonMapping {
    std::vector<ButtonBinding> bindings;

    std::optional<int> code_for(const std::string& button) const;
    const ButtonBinding* find_code(int code) const;
};

// Each canonical axis appears at most once; a missing axis was skipped
struct AxisMapping {
    std::vector<AxisBinding> bindings;

    const AxisBinding* find(const std::string& axis) const;
};
