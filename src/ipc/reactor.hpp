/**
 * caserun Reactor
 *
 * Thin epoll wrapper. Callbacks run on the thread calling poll().
 */
#pragma once
#include <cstdint>
#include <functional>
#include <sys/epoll.h>
#include <unordered_map>
#include <vector>

namespace caserun::ipc {

using EventCallback = std::function<void(int fd, uint32_t events)>;

class Reactor {
public:
    Reactor();
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    bool init();

    bool add(int fd, uint32_t events, EventCallback callback);
    bool modify(int fd, uint32_t events);
    bool remove(int fd);

    // Dispatches ready callbacks. Returns the number handled, 0 on timeout
    // or EINTR, -1 on error.
    int poll(int timeout_ms);

    size_t size() const { return callbacks_.size(); }

private:
    int epoll_fd_ = -1;
    std::unordered_map<int, EventCallback> callbacks_;
    std::vector<struct epoll_event> events_;
};

} // namespace caserun::ipc
