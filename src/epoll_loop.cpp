#include "epoll_loop.hpp"
#include "log.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <algorithm>

EpollLoop::EpollLoop() : epoll_fd(-1) {
}

EpollLoop::~EpollLoop() {
    if (epoll_fd >= 0) {
        close(epoll_fd);
    }
}

bool EpollLoop::initialize() {
    epoll_fd = epoll_create1(0);
    if (epoll_fd < 0) {
        perror("Failed to create epoll");
        return false;
    }
    return true;
}

bool EpollLoop::add_device(InputSource* device) {
    if (!device || epoll_fd < 0 || device->get_fd() < 0) {
        return false;
    }
    if (std::find(devices.begin(), devices.end(), device) != devices.end()) {
        return true;
    }

    struct epoll_event event = {};
    event.events = EPOLLIN;
    event.data.ptr = device;

    if (epoll_ctl(epoll_fd, EPOLL_CTL_ADD, device->get_fd(), &event) < 0) {
        perror("Failed to add device to epoll");
        return false;
    }

    devices.push_back(device);
    return true;
}

void EpollLoop::remove_device(InputSource* device) {
    DEBUG_LOG("Dropping %s from the scan\n", device->get_path().c_str());
    epoll_ctl(epoll_fd, EPOLL_CTL_DEL, device->get_fd(), nullptr);
    devices.erase(std::remove(devices.begin(), devices.end(), device), devices.end());
}

int EpollLoop::run_once(std::vector<InputSource*>& active, int timeout_ms) {
    if (epoll_fd < 0) {
        return -1;
    }

    struct epoll_event events[16];
    int nfds = epoll_wait(epoll_fd, events, 16, timeout_ms);

    if (nfds < 0) {
        if (errno == EINTR) return 0;
        perror("epoll_wait failed");
        return -1;
    }

    for (int i = 0; i < nfds; i++) {
        auto* device = static_cast<InputSource*>(events[i].data.ptr);

        bool got_input = false;
        if (events[i].events & EPOLLIN) {
            got_input = drain_device(device);
        }

        if (events[i].events & (EPOLLHUP | EPOLLERR)) {
            remove_device(device);
            continue;
        }

        if (got_input) {
            active.push_back(device);
        }
    }

    return nfds;
}

// True when at least one event was read. A read error takes the device out.
bool EpollLoop::drain_device(InputSource* device) {
    bool got_input = false;
    while (true) {
        InputEvent ev;
        int rc = device->read_event(ev);

        if (rc == -EAGAIN) {
            break;
        }
        if (rc < 0) {
            remove_device(device);
            return false;
        }
        got_input = true;
    }
    return got_input;
}
