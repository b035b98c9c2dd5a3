#pragma once

#include "gest/core/types.hpp"
#include <stdexcept>
#include <string>

/**
 * @file exception.h
 * @brief Exception types for unrecoverable setup failures
 *
 * Per-frame and per-run errors travel as Result/Status values. Exceptions are
 * reserved for configuration and construction failures.
 */

namespace gest {
namespace core {

/**
 * @brief Base exception class for all Gest exceptions
 *
 * Carries a result code and the throw site as context.
 */
class Exception : public std::runtime_error {
public:
    /**
     * @brief Construct exception with result code and message
     * @param code Result code indicating error type
     * @param message Detailed error description
     * @param context Additional context information
     */
    Exception(ResultCode code,
              const std::string& message,
              const std::string& context = "")
        : std::runtime_error(formatMessage(code, message, context))
        , result_code_(code)
        , message_(message)
        , context_(context) {}

    ResultCode getResultCode() const noexcept { return result_code_; }

    const std::string& getMessage() const noexcept { return message_; }

    const std::string& getContext() const noexcept { return context_; }

private:
    ResultCode result_code_;
    std::string message_;
    std::string context_;

    static std::string formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context);
};

/**
 * @brief Invalid or unreadable configuration
 */
class ConfigException : public Exception {
public:
    ConfigException(const std::string& message,
                    const std::string& context = "")
        : Exception(ResultCode::ERROR_CONFIGURATION, message, context) {}
};

/**
 * @brief Landmark detector could not be constructed or driven
 */
class DetectorException : public Exception {
public:
    DetectorException(const std::string& message,
                      const std::string& context = "")
        : Exception(ResultCode::ERROR_DETECTOR_FAILURE, message, context) {}
};

/**
 * @brief Convert result code to string representation
 */
std::string resultCodeToString(ResultCode code);

/**
 * @brief Macros for throwing exceptions with automatic context
 */
#define GEST_THROW(ExceptionType, message) \
    throw ExceptionType(message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define GEST_THROW_CODE(ExceptionType, code, message) \
    throw ExceptionType(code, message, std::string(__FILE__) + ":" + std::to_string(__LINE__))

} // namespace core
} // namespace gest
