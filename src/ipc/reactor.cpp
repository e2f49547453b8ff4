#include "ipc/reactor.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace caserun::ipc {

namespace {
constexpr int MAX_EVENTS = 64;
}

Reactor::Reactor()
    : events_(MAX_EVENTS) {}

Reactor::~Reactor() {
    if (epoll_fd_ >= 0) {
        close(epoll_fd_);
    }
}

bool Reactor::init() {
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        spdlog::error("Failed to create epoll instance: {}", strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::add(int fd, uint32_t events, EventCallback callback) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) < 0) {
        spdlog::error("epoll add failed for fd {}: {}", fd, strerror(errno));
        return false;
    }
    callbacks_[fd] = std::move(callback);
    return true;
}

bool Reactor::modify(int fd, uint32_t events) {
    struct epoll_event ev;
    std::memset(&ev, 0, sizeof(ev));
    ev.events = events;
    ev.data.fd = fd;

    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) < 0) {
        spdlog::error("epoll modify failed for fd {}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

bool Reactor::remove(int fd) {
    callbacks_.erase(fd);
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr) < 0) {
        spdlog::debug("epoll remove failed for fd {}: {}", fd, strerror(errno));
        return false;
    }
    return true;
}

int Reactor::poll(int timeout_ms) {
    int n = epoll_wait(epoll_fd_, events_.data(), MAX_EVENTS, timeout_ms);
    if (n < 0) {
        if (errno == EINTR) {
            return 0;
        }
        spdlog::error("epoll_wait failed: {}", strerror(errno));
        return -1;
    }

    for (int i = 0; i < n; ++i) {
        int fd = events_[i].data.fd;
        auto it = callbacks_.find(fd);
        if (it == callbacks_.end()) {
            continue;  // removed by an earlier callback this round
        }
        // Copy: the callback may remove itself
        EventCallback callback = it->second;
        callback(fd, events_[i].events);
    }
    return n;
}

} // namespace caserun::ipc
