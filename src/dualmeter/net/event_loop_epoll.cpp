/**
 * dualmeter Event Loop - epoll Implementation (Linux)
 *
 * - Edge-triggered sockets (EPOLLET)
 * - timerfd per armed timer
 * - eventfd wakeup for post() and stop()
 */

#include "event_loop.h"
#include "../core/logger.h"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <sys/types.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace dualmeter {
namespace net {

/**
 * Event handler storage
 */
struct EventHandlerData {
    EventHandler handler;
    void* user_data;
    IOEvent events;  // Registered events
};

struct TimerData {
    int fd;
    bool repeat;
    TimerCallback callback;
};

/**
 * epoll-based event loop implementation
 */
class EpollEventLoop : public EventLoop {
public:
    EpollEventLoop()
        : epoll_fd_(-1)
        , wake_fd_(-1)
        , running_(false)
    {
        epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
        if (epoll_fd_ < 0) {
            throw std::runtime_error(std::string("epoll_create1() failed: ") + strerror(errno));
        }

        wake_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd_ < 0) {
            int saved = errno;
            close(epoll_fd_);
            throw std::runtime_error(std::string("eventfd() failed: ") + strerror(saved));
        }

        struct epoll_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.events = EPOLLIN;
        ev.data.fd = wake_fd_;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, wake_fd_, &ev) < 0) {
            int saved = errno;
            close(wake_fd_);
            close(epoll_fd_);
            throw std::runtime_error(std::string("epoll_ctl(wake) failed: ") + strerror(saved));
        }

        events_.resize(256);
    }

    ~EpollEventLoop() override {
        for (auto& entry : timers_) {
            close(entry.second.fd);
        }
        if (wake_fd_ >= 0) {
            close(wake_fd_);
        }
        if (epoll_fd_ >= 0) {
            close(epoll_fd_);
        }
    }

    int add_fd(int fd, IOEvent events, EventHandler handler, void* user_data) override {
        if (fd < 0 || !handler) {
            errno = EINVAL;
            return -1;
        }

        auto data = std::make_shared<EventHandlerData>();
        data->handler = std::move(handler);
        data->user_data = user_data;
        data->events = events;

        if (update_epoll_events(fd, events, false) < 0) {
            return -1;
        }
        handlers_[fd] = std::move(data);
        return 0;
    }

    int modify_fd(int fd, IOEvent events) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        it->second->events = events;
        return update_epoll_events(fd, events, true);
    }

    int remove_fd(int fd) override {
        auto it = handlers_.find(fd);
        if (it == handlers_.end()) {
            errno = ENOENT;
            return -1;
        }

        struct epoll_event ev;
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, &ev) < 0) {
            // ENOENT/EBADF: already gone from the interest list
            if (errno != ENOENT && errno != EBADF) {
                return -1;
            }
        }

        handlers_.erase(it);
        return 0;
    }

    int add_timer(uint64_t delay_ms, bool repeat, TimerCallback callback) override {
        int tfd = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
        if (tfd < 0) {
            return -1;
        }

        if (delay_ms == 0) {
            delay_ms = 1;  // a zero it_value disarms the timer
        }

        struct itimerspec spec;
        std::memset(&spec, 0, sizeof(spec));
        spec.it_value.tv_sec = static_cast<time_t>(delay_ms / 1000);
        spec.it_value.tv_nsec = static_cast<long>((delay_ms % 1000) * 1000000);
        if (repeat) {
            spec.it_interval = spec.it_value;
        }

        if (timerfd_settime(tfd, 0, &spec, nullptr) < 0) {
            close(tfd);
            return -1;
        }

        int timer_id = next_timer_id_++;
        auto handler = [this, timer_id](int fd, IOEvent, void*) {
            uint64_t expirations = 0;
            if (::read(fd, &expirations, sizeof(expirations)) != sizeof(expirations)) {
                return;
            }

            auto it = timers_.find(timer_id);
            if (it == timers_.end()) {
                return;
            }

            // Copy first: the callback may cancel this timer
            TimerCallback cb = it->second.callback;
            if (!it->second.repeat) {
                cancel_timer(timer_id);
            }
            cb();
        };

        if (add_fd(tfd, IOEvent::READ, handler, nullptr) < 0) {
            close(tfd);
            return -1;
        }

        timers_[timer_id] = TimerData{tfd, repeat, std::move(callback)};
        return timer_id;
    }

    int cancel_timer(int timer_id) override {
        auto it = timers_.find(timer_id);
        if (it == timers_.end()) {
            return -1;
        }

        int tfd = it->second.fd;
        timers_.erase(it);
        remove_fd(tfd);
        close(tfd);
        return 0;
    }

    void post(PostedTask task) override {
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            tasks_.push_back(std::move(task));
        }
        wake();
    }

    int poll(int timeout_ms) override {
        int n_events = epoll_wait(epoll_fd_, events_.data(),
                                  static_cast<int>(events_.size()), timeout_ms);

        if (n_events < 0) {
            if (errno == EINTR) {
                return 0;
            }
            return -1;
        }

        for (int i = 0; i < n_events; i++) {
            struct epoll_event& ev = events_[i];
            int fd = ev.data.fd;

            if (fd == wake_fd_) {
                drain_wakeups();
                run_posted_tasks();
                continue;
            }

            auto it = handlers_.find(fd);
            if (it == handlers_.end()) {
                continue;  // Removed by an earlier handler in this batch
            }

            // Hold a reference: the handler may remove its own fd
            std::shared_ptr<EventHandlerData> data = it->second;

            IOEvent event_type = static_cast<IOEvent>(0);
            if (ev.events & EPOLLIN) {
                event_type = IOEvent::READ;
            }
            if (ev.events & EPOLLOUT) {
                event_type = event_type | IOEvent::WRITE;
            }
            if (ev.events & (EPOLLHUP | EPOLLRDHUP)) {
                event_type = event_type | IOEvent::HUP;
            }
            if (ev.events & EPOLLERR) {
                event_type = event_type | IOEvent::ERROR;
            }

            try {
                data->handler(fd, event_type, data->user_data);
            } catch (const std::exception& e) {
                LOG_ERROR("Server", "Event handler exception on fd=%d: %s", fd, e.what());
            }
        }

        if (n_events == static_cast<int>(events_.size())) {
            events_.resize(events_.size() * 2);
        }

        return n_events;
    }

    void run() override {
        running_.store(true, std::memory_order_release);

        // Tasks posted before run() started
        run_posted_tasks();

        while (!stop_requested_.load(std::memory_order_acquire)) {
            int result = poll(100);
            if (result < 0 && errno != EINTR) {
                LOG_ERROR("Server", "epoll_wait() failed: %s", strerror(errno));
                break;
            }
        }

        running_.store(false, std::memory_order_release);
    }

    void stop() override {
        stop_requested_.store(true, std::memory_order_release);
        wake();
    }

    bool is_running() const override {
        return running_.load(std::memory_order_acquire);
    }

    const char* platform_name() const override {
        return "epoll";
    }

private:
    int update_epoll_events(int fd, IOEvent events, bool modify) {
        struct epoll_event ev;
        std::memset(&ev, 0, sizeof(ev));
        ev.data.fd = fd;

        if (events & IOEvent::READ) {
            ev.events |= EPOLLIN;
        }
        if (events & IOEvent::WRITE) {
            ev.events |= EPOLLOUT;
        }
        if (events & IOEvent::EDGE) {
            ev.events |= EPOLLET;
        }

        // Always enable EPOLLRDHUP to detect peer shutdown
        ev.events |= EPOLLRDHUP;

        int op = modify ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
        return epoll_ctl(epoll_fd_, op, fd, &ev) < 0 ? -1 : 0;
    }

    void wake() {
        uint64_t one = 1;
        ssize_t n = ::write(wake_fd_, &one, sizeof(one));
        (void)n;  // EAGAIN means the counter is already non-zero
    }

    void drain_wakeups() {
        uint64_t value = 0;
        while (::read(wake_fd_, &value, sizeof(value)) == sizeof(value)) {
        }
    }

    void run_posted_tasks() {
        std::vector<PostedTask> batch;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            batch.swap(tasks_);
        }
        for (auto& task : batch) {
            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Server", "Posted task exception: %s", e.what());
            }
        }
    }

    int epoll_fd_;
    int wake_fd_;
    std::unordered_map<int, std::shared_ptr<EventHandlerData>> handlers_;
    std::unordered_map<int, TimerData> timers_;
    int next_timer_id_{0};
    std::vector<struct epoll_event> events_;
    std::atomic<bool> running_;
    std::atomic<bool> stop_requested_{false};  // sticky, even if set before run()

    std::mutex tasks_mutex_;
    std::vector<PostedTask> tasks_;
};

std::unique_ptr<EventLoop> create_epoll_event_loop() {
    return std::make_unique<EpollEventLoop>();
}

} // namespace net
} // namespace dualmeter
