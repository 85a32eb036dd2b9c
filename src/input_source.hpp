#ifndef INPUT_SOURCE_HPP
#define INPUT_SOURCE_HPP

#include <string>
#include <optional>
#include <linux/input.h>
#include <libevdev-1.0/libevdev/libevdev.h>

#include "event_source.hpp"

// An evdev device node opened through libevdev
class InputSource : public EventSource {
public:
    InputSource() : fd(-1), dev(nullptr), syncing(false) {}
    ~InputSource() override;

    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;

    // Returns 0 on success, -errno otherwise
    int open_device(const std::string& device_path);
    void close_and_free();

    // Non-blocking read: 0 on success, -EAGAIN when the queue is empty,
    // another negative errno when the device is gone
    int read_event(InputEvent& out);

    std::optional<InputEvent> next_event() override;
    void drain() override;
    std::optional<AxisRange> axis_range(int code) const override;
    std::string name() const override;

    const std::string& get_path() const { return path; }
    int get_fd() const { return fd; }
    bool is_open() const { return fd >= 0 && dev != nullptr; }

private:
    std::string path;
    int fd;
    struct libevdev* dev;
    bool syncing;

    bool wait_readable();
};

#endif // INPUT_SOURCE_HPP
