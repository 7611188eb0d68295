/**
 * dualmeter Event Loop - Abstract Interface
 *
 * One loop per worker thread. Sockets, timers and cross-thread wakeups
 * are all file descriptors registered with the same poller, so a
 * connection's reads, writes, idle timer and drain command are all
 * handled on the thread that owns it.
 *
 * Implementation: epoll (EPOLLET for edge-triggered sockets, timerfd for
 * timers, eventfd for post()).
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <sys/socket.h>

namespace dualmeter {
namespace net {

/**
 * I/O event types
 */
enum class IOEvent {
    READ = 1 << 0,      // Socket readable
    WRITE = 1 << 1,     // Socket writable
    ERROR = 1 << 2,     // Socket error
    HUP = 1 << 3,       // Connection closed
    EDGE = 1 << 4       // Edge-triggered mode
};

inline IOEvent operator|(IOEvent a, IOEvent b) {
    return static_cast<IOEvent>(static_cast<int>(a) | static_cast<int>(b));
}

inline bool operator&(IOEvent a, IOEvent b) {
    return (static_cast<int>(a) & static_cast<int>(b)) != 0;
}

/**
 * Event handler callback
 *
 * Args:
 * - fd: File descriptor that triggered event
 * - events: IOEvent flags (READ, WRITE, ERROR, HUP)
 * - user_data: User-provided pointer
 *
 * A handler may remove its own fd (or any other) while running.
 */
using EventHandler = std::function<void(int fd, IOEvent events, void* user_data)>;

/**
 * Timer callback. Runs on the loop thread.
 */
using TimerCallback = std::function<void()>;

/**
 * Task posted from another thread.
 */
using PostedTask = std::function<void()>;

/**
 * Abstract event loop interface
 */
class EventLoop {
public:
    virtual ~EventLoop() = default;

    /**
     * Add file descriptor to event loop
     *
     * @param fd File descriptor to monitor
     * @param events IOEvent flags (READ, WRITE, EDGE)
     * @param handler Callback when event occurs
     * @param user_data User pointer passed to handler
     * @return 0 on success, -1 on error (check errno)
     */
    virtual int add_fd(int fd, IOEvent events, EventHandler handler, void* user_data = nullptr) = 0;

    /**
     * Modify events for existing file descriptor
     *
     * @return 0 on success, -1 on error
     */
    virtual int modify_fd(int fd, IOEvent events) = 0;

    /**
     * Remove file descriptor from event loop
     *
     * @return 0 on success, -1 on error
     */
    virtual int remove_fd(int fd) = 0;

    /**
     * Arm a timer.
     *
     * @param delay_ms First expiry, in milliseconds
     * @param repeat If true, the timer re-fires every delay_ms
     * @param callback Invoked on the loop thread
     * @return Timer id (>= 0), or -1 on error
     */
    virtual int add_timer(uint64_t delay_ms, bool repeat, TimerCallback callback) = 0;

    /**
     * Disarm and release a timer. Safe to call from inside its callback.
     *
     * @return 0 on success, -1 if the id is unknown
     */
    virtual int cancel_timer(int timer_id) = 0;

    /**
     * Queue a task for execution on the loop thread.
     *
     * Thread-safe. Wakes the loop if it is blocked in poll().
     */
    virtual void post(PostedTask task) = 0;

    /**
     * Run one iteration of the event loop
     *
     * Waits for events (up to timeout_ms) and dispatches handlers.
     *
     * @param timeout_ms Timeout in milliseconds (-1 = infinite, 0 = non-blocking)
     * @return Number of events processed, or -1 on error
     */
    virtual int poll(int timeout_ms = -1) = 0;

    /**
     * Run the event loop until stop() is called.
     */
    virtual void run() = 0;

    /**
     * Stop the event loop
     *
     * Thread-safe. Can be called from any thread.
     */
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    /**
     * @return "epoll"
     */
    virtual const char* platform_name() const = 0;

    // Socket helpers shared by TcpSocket, UdpSocket and the listeners.
    // All return 0 on success, -1 with errno set.
    static int set_nonblocking(int fd);
    static int set_tcp_nodelay(int fd);
    static int set_reuseaddr(int fd);
    static int set_reuseport(int fd);
    static int set_recv_timeout(int fd, int timeout_ms);
    static int set_recv_buffer_size(int fd, int bytes);

    /**
     * Set the IPv4 don't-fragment bit on outgoing datagrams (QUIC
     * requires it on every packet).
     */
    static int set_dont_fragment(int fd);

    /**
     * Local (getsockname) or peer (getpeername) IPv4 address of a socket.
     */
    static bool socket_address(int fd, bool peer, std::string& ip, uint16_t& port);
};

/**
 * Create the platform event loop.
 *
 * @return Event loop
 * @throws std::runtime_error if the poller or wakeup descriptor cannot be created
 */
std::unique_ptr<EventLoop> create_event_loop();

/**
 * Get recommended number of worker threads
 *
 * Returns hardware_concurrency - 2, at least 1.
 */
uint32_t recommended_worker_count();

} // namespace net
} // namespace dualmeter
