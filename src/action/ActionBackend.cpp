#include "gest/action/ActionBackend.hpp"
#include "gest/core/Logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gest {
namespace action {

namespace {

constexpr int SCROLL_UP_BUTTON = 4;
constexpr int SCROLL_DOWN_BUTTON = 5;

std::string join(const std::vector<std::string>& parts) {
    std::string joined;
    for (const auto& part : parts) {
        joined += (joined.empty() ? "" : " ") + part;
    }
    return joined;
}

} // namespace

bool executable_available(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0;
    }

    const char* path = std::getenv("PATH");
    if (path == nullptr) {
        return false;
    }

    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        const std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// CommandActionBackend
// ============================================================================

CommandActionBackend::CommandActionBackend(std::string xdotool)
    : xdotool_(std::move(xdotool)) {
}

std::vector<std::string> CommandActionBackend::build_command(const ActionDescriptor& descriptor) const {
    switch (descriptor.kind) {
        case ActionKind::KEY_PRESS: {
            std::string combo;
            for (const auto& key : descriptor.keys) {
                combo += (combo.empty() ? "" : "+") + key;
            }
            return {xdotool_, "key", "--clearmodifiers", combo};
        }
        case ActionKind::MOUSE_CLICK:
            return {xdotool_, "click", "--repeat", std::to_string(descriptor.clicks),
                    std::to_string(static_cast<int>(descriptor.button))};
        case ActionKind::MOUSE_SCROLL: {
            const int button = descriptor.amount > 0 ? SCROLL_UP_BUTTON : SCROLL_DOWN_BUTTON;
            return {xdotool_, "click", "--repeat", std::to_string(std::abs(static_cast<long long>(descriptor.amount))),
                    std::to_string(button)};
        }
        case ActionKind::CUSTOM_COMMAND:
            return {"/bin/sh", "-c", descriptor.command};
        default:
            return {};
    }
}

core::Status<ActionError> CommandActionBackend::execute(const ActionDescriptor& descriptor) {
    using StatusType = core::Status<ActionError>;

    auto valid = validate_descriptor(descriptor);
    if (!valid) {
        return valid;
    }

    const std::vector<std::string> argv = build_command(descriptor);
    if (argv.empty()) {
        return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "No command for " + descriptor.describe());
    }

    if (!executable_available(argv.front())) {
        return StatusType::failure(ActionError::BACKEND_UNAVAILABLE, argv.front() + " not found in PATH");
    }

    LOG_DEBUG("CommandActionBackend: running " + join(argv));
    return run(argv);
}

core::Status<ActionError> CommandActionBackend::run(const std::vector<std::string>& argv) const {
    using StatusType = core::Status<ActionError>;

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return StatusType::failure(ActionError::BACKEND_UNAVAILABLE,
            std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        ::execvp(args[0], args.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return StatusType::failure(ActionError::EXECUTION_FAILED,
                std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return StatusType::ok();
    }

    if (WIFEXITED(status)) {
        return StatusType::failure(ActionError::EXECUTION_FAILED,
            argv.front() + " exited with status " + std::to_string(WEXITSTATUS(status)));
    }
    return StatusType::failure(ActionError::EXECUTION_FAILED, argv.front() + " terminated abnormally");
}

// ============================================================================
// LoggingActionBackend
// ============================================================================

core::Status<ActionError> LoggingActionBackend::execute(const ActionDescriptor& descriptor) {
    auto valid = validate_descriptor(descriptor);
    if (!valid) {
        return valid;
    }

    LOG_INFO("LoggingActionBackend: " + descriptor.describe());
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(descriptor.describe());
    return core::Status<ActionError>::ok();
}

std::vector<std::string> LoggingActionBackend::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

} // namespace action
} // namespace gest
