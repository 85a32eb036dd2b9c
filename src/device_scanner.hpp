#ifndef DEVICE_SCANNER_HPP
#define DEVICE_SCANNER_HPP

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& what) : std::runtime_error(what) {}
};

// Where candidate devices come from and how the scanner waits on them
class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    // Paths of every input device node, readable or not
    virtual std::vector<std::string> list_devices() = 0;

    // Opens the given devices, blocks until at least one has input and
    // returns the paths that produced input in that wait
    virtual std::vector<std::string> wait_for_input(const std::vector<std::string>& paths) = 0;

    virtual void pause(std::chrono::milliseconds delay) = 0;
};

// /dev/input/event* through libevdev and epoll
class EvdevBackend : public DeviceBackend {
public:
    explicit EvdevBackend(std::string input_dir = "/dev/input");

    std::vector<std::string> list_devices() override;
    std::vector<std::string> wait_for_input(const std::vector<std::string>& paths) override;
    void pause(std::chrono::milliseconds delay) override;

private:
    std::string input_dir;
};

class DeviceScanner {
public:
    DeviceScanner(DeviceBackend& backend, std::chrono::milliseconds settle_delay);

    // Blocks until exactly one device produces input and returns its path
    std::string detect_gamepad();

    int get_attempts() const { return attempts; }

private:
    DeviceBackend& backend;
    std::chrono::milliseconds settle_delay;
    int attempts;
};

#endif // DEVICE_SCANNER_HPP
