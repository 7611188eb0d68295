#pragma once

#include <new>
#include <type_traits>
#include <utility>

namespace dualmeter {
namespace core {

/**
 * Error codes carried by result<T>.
 *
 * The first block is generic; the second is the server's error taxonomy.
 * Per-connection codes (handshake_failure, connection_reset,
 * protocol_violation) never leave their terminator; config_error,
 * content_load_error and bind_error are fatal at startup.
 */
enum class error_code : int {
    success = 0,
    invalid_state,
    internal_error,
    parse_error,

    handshake_failure = 100,
    connection_reset,
    config_error,
    content_load_error,
    route_not_found,
    protocol_violation,
    bind_error
};

/**
 * Stable lowercase name for an error code, used in log lines.
 */
inline const char* error_code_name(error_code code) noexcept {
    switch (code) {
        case error_code::success: return "success";
        case error_code::invalid_state: return "invalid_state";
        case error_code::internal_error: return "internal_error";
        case error_code::parse_error: return "parse_error";
        case error_code::handshake_failure: return "handshake_failure";
        case error_code::connection_reset: return "connection_reset";
        case error_code::config_error: return "config_error";
        case error_code::content_load_error: return "content_load_error";
        case error_code::route_not_found: return "route_not_found";
        case error_code::protocol_violation: return "protocol_violation";
        case error_code::bind_error: return "bind_error";
    }
    return "unknown";
}

/**
 * A T or an error_code.
 *
 *   result<ServerConfig> r = load_config(argc, argv, env, &message);
 *   if (r.is_err()) { ... r.error() ... }
 *   use(r.value());
 *
 * value() on an error, or error() on a value, is a precondition violation.
 */
template<typename T>
class result {
public:
    result(const T& val) : ok_(true) {
        ::new (&value_) T(val);
    }

    result(T&& val) noexcept(std::is_nothrow_move_constructible_v<T>) : ok_(true) {
        ::new (&value_) T(std::move(val));
    }

    result(error_code err) noexcept : ok_(false), error_(err) {}

    result(const result& other) : ok_(other.ok_) {
        if (ok_) {
            ::new (&value_) T(other.value_);
        } else {
            error_ = other.error_;
        }
    }

    result(result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) : ok_(other.ok_) {
        if (ok_) {
            ::new (&value_) T(std::move(other.value_));
        } else {
            error_ = other.error_;
        }
    }

    result& operator=(result other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        reset();
        ok_ = other.ok_;
        if (ok_) {
            ::new (&value_) T(std::move(other.value_));
        } else {
            error_ = other.error_;
        }
        return *this;
    }

    ~result() { reset(); }

    bool is_ok() const noexcept { return ok_; }
    bool is_err() const noexcept { return !ok_; }
    explicit operator bool() const noexcept { return ok_; }

    T& value() & noexcept { return value_; }
    const T& value() const& noexcept { return value_; }
    T&& value() && noexcept { return std::move(value_); }

    error_code error() const noexcept { return ok_ ? error_code::success : error_; }

    T value_or(T fallback) && {
        return ok_ ? std::move(value_) : std::move(fallback);
    }

private:
    void reset() noexcept {
        if (ok_) {
            value_.~T();
            ok_ = false;
            error_ = error_code::invalid_state;
        }
    }

    bool ok_;
    union {
        T value_;
        error_code error_;
    };
};

/**
 * Success or an error_code, nothing else.
 */
template<>
class result<void> {
public:
    result() noexcept = default;
    result(error_code err) noexcept : error_(err) {}

    bool is_ok() const noexcept { return error_ == error_code::success; }
    bool is_err() const noexcept { return error_ != error_code::success; }
    explicit operator bool() const noexcept { return is_ok(); }
    error_code error() const noexcept { return error_; }

private:
    error_code error_{error_code::success};
};

inline result<void> ok() noexcept {
    return result<void>();
}

inline result<void> err(error_code code) noexcept {
    return result<void>(code);
}

} // namespace core
} // namespace dualmeter
