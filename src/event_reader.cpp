#include "event_reader.hpp"
#include "event_names.hpp"
#include "log.hpp"

void EventReader::drain() {
    source.drain();
}

InputEvent EventReader::next_event() {
    auto ev = source.next_event();
    if (!ev) {
        throw DeviceError("input device " + source.name() + " stopped delivering events");
    }
    return *ev;
}

PhysicalKey EventReader::next_key_press() {
    while (true) {
        InputEvent ev = next_event();
        if (ev.kind == EventKind::Key && ev.value == 1) {
            return PhysicalKey{ev.code, key_name(ev.code)};
        }
    }
}

std::optional<AxisExtreme> EventReader::next_extreme_axis(std::optional<int> cancel_key) {
    while (true) {
        InputEvent ev = next_event();

        if (ev.kind == EventKind::Key) {
            if (cancel_key && ev.value == 1 && ev.code == *cancel_key) {
                return std::nullopt;
            }
            continue;
        }

        if (ev.kind != EventKind::Axis) {
            continue;
        }

        auto range = source.axis_range(ev.code);
        if (!range || !range->usable()) {
            continue;
        }

        if (ev.value <= range->min) {
            DEBUG_LOG("axis %d reached min %d\n", ev.code, range->min);
            return AxisExtreme{Extreme::Min, ev.code, axis_name(ev.code)};
        }
        if (ev.value >= range->max) {
            DEBUG_LOG("axis %d reached max %d\n", ev.code, range->max);
            return AxisExtreme{Extreme::Max, ev.code, axis_name(ev.code)};
        }
    }
}
