#pragma once

#include <string>
#include <vector>

struct ButtonSlot {
    const char* name;    // emulator name
    const char* label;
};

enum class AxisShape {
    Bidirectional,
    Unidirectional
};

struct AxisSlot {
    const char* name;
    const char* label;
    AxisShape shape;
    // directions[0] must land on the axis minimum for a non-inverted axis
    const char* directions[2];
};

const std::vector<ButtonSlot>& button_catalog();
const std::vector<AxisSlot>& axis_catalog();

std::string button_label(const std::string& name);
std::string axis_label(const std::string& name);
