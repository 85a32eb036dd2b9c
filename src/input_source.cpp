#include "input_source.hpp"
#include "log.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace {

InputEvent to_input_event(const struct input_event& ev) {
    EventKind kind = EventKind::Other;
    if (ev.type == EV_KEY) {
        kind = EventKind::Key;
    } else if (ev.type == EV_ABS) {
        kind = EventKind::Axis;
    }
    return InputEvent{kind, ev.code, ev.value};
}

}

InputSource::~InputSource() {
    close_and_free();
}

int InputSource::open_device(const std::string& device_path) {
    close_and_free();

    fd = open(device_path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fd < 0) {
        return -errno;
    }

    int rc = libevdev_new_from_fd(fd, &dev);
    if (rc < 0) {
        close(fd);
        fd = -1;
        dev = nullptr;
        return rc;
    }

    path = device_path;
    return 0;
}

void InputSource::close_and_free() {
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
    syncing = false;
    path.clear();
}

bool InputSource::wait_readable() {
    struct pollfd pfd = {fd, POLLIN, 0};
    while (true) {
        int ret = poll(&pfd, 1, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            perror("poll failed");
            return false;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            return false;
        }
        return true;
    }
}

int InputSource::read_event(InputEvent& out) {
    if (!is_open()) {
        return -ENODEV;
    }

    while (true) {
        struct input_event ev;
        unsigned int flags = syncing ? LIBEVDEV_READ_FLAG_SYNC : LIBEVDEV_READ_FLAG_NORMAL;
        int rc = libevdev_next_event(dev, flags, &ev);

        if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
            out = to_input_event(ev);
            return 0;
        }

        // SYN_DROPPED: the following reads replay the device state
        if (rc == LIBEVDEV_READ_STATUS_SYNC) {
            syncing = true;
            out = to_input_event(ev);
            return 0;
        }

        if (rc == -EAGAIN && syncing) {
            syncing = false;
            continue;
        }

        return rc;
    }
}

std::optional<InputEvent> InputSource::next_event() {
    while (true) {
        InputEvent ev;
        int rc = read_event(ev);
        if (rc == 0) {
            return ev;
        }
        if (rc != -EAGAIN) {
            DEBUG_LOG("read from %s failed: %s\n", path.c_str(), strerror(-rc));
            return std::nullopt;
        }
        if (!wait_readable()) {
            return std::nullopt;
        }
    }
}

void InputSource::drain() {
    InputEvent ev;
    while (read_event(ev) == 0) {
        // Just drain the queue
    }
}

std::optional<AxisRange> InputSource::axis_range(int code) const {
    if (!is_open() || !libevdev_has_event_code(dev, EV_ABS, code)) {
        return std::nullopt;
    }
    return AxisRange{libevdev_get_abs_minimum(dev, code), libevdev_get_abs_maximum(dev, code)};
}

std::string InputSource::name() const {
    const char* n = dev ? libevdev_get_name(dev) : nullptr;
    return n ? n : "Unknown";
}
