#include "gest/core/exception.h"
#include <sstream>

namespace gest {
namespace core {

std::string Exception::formatMessage(ResultCode code,
                                     const std::string& message,
                                     const std::string& context) {
    std::ostringstream oss;
    oss << "[" << resultCodeToString(code) << "] " << message;
    if (!context.empty()) {
        oss << " (at " << context << ")";
    }
    return oss.str();
}

std::string resultCodeToString(ResultCode code) {
    switch (code) {
        case ResultCode::SUCCESS:
            return "SUCCESS";
        case ResultCode::ERROR_GENERIC:
            return "ERROR_GENERIC";
        case ResultCode::ERROR_INVALID_PARAMETER:
            return "ERROR_INVALID_PARAMETER";
        case ResultCode::ERROR_CONFIGURATION:
            return "ERROR_CONFIGURATION";
        case ResultCode::ERROR_DETECTOR_FAILURE:
            return "ERROR_DETECTOR_FAILURE";
        default:
            return "UNKNOWN_ERROR";
    }
}

} // namespace core
} // namespace gest
