#ifndef EPOLL_LOOP_HPP
#define EPOLL_LOOP_HPP

#include <vector>
#include <sys/epoll.h>

#include "input_source.hpp"

class EpollLoop {
public:
    EpollLoop();
    ~EpollLoop();

    EpollLoop(const EpollLoop&) = delete;
    EpollLoop& operator=(const EpollLoop&) = delete;

    bool initialize();
    bool add_device(InputSource* device);

    // Waits for readiness (-1 blocks forever) and drains every ready device.
    // Devices that delivered at least one event are appended to `active`,
    // devices that hung up leave the set. Returns -1 when the wait fails.
    int run_once(std::vector<InputSource*>& active, int timeout_ms = -1);

    size_t device_count() const { return devices.size(); }

private:
    int epoll_fd;
    std::vector<InputSource*> devices;

    bool drain_device(InputSource* device);
    void remove_device(InputSource* device);
};

#endif // EPOLL_LOOP_HPP
