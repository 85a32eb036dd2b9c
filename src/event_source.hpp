#ifndef EVENT_SOURCE_HPP
#define EVENT_SOURCE_HPP

#include <optional>
#include <string>

#include "input_event.hpp"

// One opened input device. The wizards only ever talk to this interface so
// tests can feed them a bounded, scripted stream.
class EventSource {
public:
    virtual ~EventSource() = default;

    // Blocks until the next event. Returns nullopt once the source is gone.
    virtual std::optional<InputEvent> next_event() = 0;

    // Discards everything already queued without blocking.
    virtual void drain() = 0;

    virtual std::optional<AxisRange> axis_range(int code) const = 0;

    virtual std::string name() const = 0;
};

#endif // EVENT_SOURCE_HPP
