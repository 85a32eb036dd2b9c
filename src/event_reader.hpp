#ifndef EVENT_READER_HPP
#define EVENT_READER_HPP

#include <optional>
#include <stdexcept>
#include <string>

#include "event_source.hpp"
#include "input_event.hpp"

class DeviceError : public std::runtime_error {
public:
    explicit DeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Blocking queries the wizards make against one device
class EventReader {
public:
    explicit EventReader(EventSource& source) : source(source) {}

    void drain();

    // Next key-down. Key-up, autorepeat and non-key events are skipped.
    PhysicalKey next_key_press();

    // Next axis event sitting on its min or max. Returns nullopt when
    // cancel_key is pressed first.
    std::optional<AxisExtreme> next_extreme_axis(std::optional<int> cancel_key);

private:
    EventSource& source;

    InputEvent next_event();
};

#endif // EVENT_READER_HPP
