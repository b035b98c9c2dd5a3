/**
 * @file types.hpp
 * @brief Common type definitions for Gest
 *
 * Fundamental aliases, result codes and the Result/Status templates used by
 * every component to report recoverable errors without exceptions.
 */

#ifndef GEST_CORE_TYPES_HPP
#define GEST_CORE_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace gest {
namespace core {

/**
 * @brief Monotonic time used for frames and events
 */
using Clock = std::chrono::steady_clock;
using Timestamp = Clock::time_point;

/**
 * @brief Milliseconds since the Unix epoch (persisted timestamps)
 */
inline int64_t wallClockMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/**
 * @brief Result codes carried by core::Exception
 */
enum class ResultCode {
    SUCCESS = 0,
    ERROR_GENERIC,
    ERROR_INVALID_PARAMETER,
    ERROR_CONFIGURATION,
    ERROR_DETECTOR_FAILURE
};

/**
 * @brief Operation result with error code, message and payload
 *
 * An empty error means success. The payload is only meaningful on success.
 */
template<typename T, typename E>
struct Result {
    std::optional<E> error;
    std::string message;
    T data{};

    static Result success(T value) {
        Result r;
        r.data = std::move(value);
        return r;
    }

    static Result failure(E code, const std::string& msg = "") {
        Result r;
        r.error = code;
        r.message = msg;
        return r;
    }

    bool isSuccess() const { return !error.has_value(); }
    bool hasError() const { return error.has_value(); }

    explicit operator bool() const { return isSuccess(); }
};

/**
 * @brief Payload-free result
 */
template<typename E>
struct Status {
    std::optional<E> error;
    std::string message;

    static Status ok() { return Status{}; }

    static Status failure(E code, const std::string& msg = "") {
        Status s;
        s.error = code;
        s.message = msg;
        return s;
    }

    bool isSuccess() const { return !error.has_value(); }
    bool hasError() const { return error.has_value(); }

    explicit operator bool() const { return isSuccess(); }
};

} // namespace core
} // namespace gest

#endif // GEST_CORE_TYPES_HPP
