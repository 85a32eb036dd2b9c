#include "device_scanner.hpp"
#include "epoll_loop.hpp"
#include "input_source.hpp"
#include "log.hpp"
#include <dirent.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <memory>
#include <set>
#include <thread>

EvdevBackend::EvdevBackend(std::string input_dir) : input_dir(std::move(input_dir)) {
}

std::vector<std::string> EvdevBackend::list_devices() {
    std::vector<std::string> paths;

    DIR* dir = opendir(input_dir.c_str());
    if (!dir) {
        DEBUG_LOG("Failed to open %s: %s\n", input_dir.c_str(), strerror(errno));
        return paths;
    }

    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        if (strncmp(entry->d_name, "event", 5) != 0) continue;
        paths.push_back(input_dir + "/" + entry->d_name);
    }
    closedir(dir);

    std::sort(paths.begin(), paths.end());
    return paths;
}

std::vector<std::string> EvdevBackend::wait_for_input(const std::vector<std::string>& paths) {
    std::vector<std::unique_ptr<InputSource>> sources;
    for (const auto& path : paths) {
        auto source = std::make_unique<InputSource>();
        int rc = source->open_device(path);
        if (rc == -EACCES || rc == -EPERM) {
            continue;
        }
        if (rc < 0) {
            DEBUG_LOG("Skipping %s: %s\n", path.c_str(), strerror(-rc));
            continue;
        }
        sources.push_back(std::move(source));
    }

    if (sources.empty()) {
        throw ScanError("no readable input devices (is this user allowed to read " + input_dir + "?)");
    }

    EpollLoop loop;
    if (!loop.initialize()) {
        throw ScanError("could not create epoll instance");
    }
    for (auto& source : sources) {
        if (!loop.add_device(source.get())) {
            DEBUG_LOG("Could not watch %s\n", source->get_path().c_str());
        }
    }

    std::set<std::string> active;
    while (active.empty()) {
        if (loop.device_count() == 0) {
            throw ScanError("every input device went away while waiting for input");
        }

        std::vector<InputSource*> ready;
        if (loop.run_once(ready, -1) < 0) {
            throw ScanError("waiting for device input failed");
        }
        for (auto* device : ready) {
            active.insert(device->get_path());
        }
    }

    // Sources without input are closed when `sources` goes out of scope
    return std::vector<std::string>(active.begin(), active.end());
}

void EvdevBackend::pause(std::chrono::milliseconds delay) {
    std::this_thread::sleep_for(delay);
}

DeviceScanner::DeviceScanner(DeviceBackend& backend, std::chrono::milliseconds settle_delay)
    : backend(backend), settle_delay(settle_delay), attempts(0) {
}

std::string DeviceScanner::detect_gamepad() {
    attempts = 0;
    while (true) {
        auto paths = backend.list_devices();
        if (paths.empty()) {
            throw ScanError("no input devices found");
        }

        attempts++;
        auto active = backend.wait_for_input(paths);
        if (active.size() == 1) {
            DEBUG_LOG("Selected %s after %d scan(s)\n", active[0].c_str(), attempts);
            backend.pause(settle_delay);
            return active[0];
        }

        DEBUG_LOG("%zu devices produced input, scanning again\n", active.size());
    }
}
