#ifndef INPUT_EVENT_HPP
#define INPUT_EVENT_HPP

#include <string>

enum class EventKind {
    Key,
    Axis,
    Other
};

struct InputEvent {
    EventKind kind;
    int code;
    int value;
};

struct AxisRange {
    int min;
    int max;

    bool usable() const { return min < max; }
};

// A physical button as reported by the driver
struct PhysicalKey {
    int code;
    std::string name;
};

enum class Extreme {
    Min,
    Max
};

struct AxisExtreme {
    Extreme extreme;
    int code;
    std::string name;
};

#endif // INPUT_EVENT_HPP
