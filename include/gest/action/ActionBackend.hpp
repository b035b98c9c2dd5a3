#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "gest/action/ActionTypes.hpp"

namespace gest {
namespace action {

/**
 * @brief OS-level executor of action descriptors
 *
 * Called from the dispatcher's worker thread only.
 */
class ActionBackend {
public:
    virtual ~ActionBackend() = default;

    virtual core::Status<ActionError> execute(const ActionDescriptor& descriptor) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Runs actions through xdotool (input) and /bin/sh (custom commands)
 */
class CommandActionBackend : public ActionBackend {
public:
    /**
     * @param xdotool Executable name or path used for keyboard and mouse actions
     */
    explicit CommandActionBackend(std::string xdotool = "xdotool");

    core::Status<ActionError> execute(const ActionDescriptor& descriptor) override;

    std::string name() const override { return "command"; }

    /**
     * @brief Command line that execute() would run for a descriptor
     */
    std::vector<std::string> build_command(const ActionDescriptor& descriptor) const;

private:
    core::Status<ActionError> run(const std::vector<std::string>& argv) const;

    std::string xdotool_;
};

/**
 * @brief Dry-run backend: logs and records descriptors without side effects
 */
class LoggingActionBackend : public ActionBackend {
public:
    core::Status<ActionError> execute(const ActionDescriptor& descriptor) override;

    std::string name() const override { return "log"; }

    std::vector<std::string> history() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> history_;
};

/**
 * @brief Find an executable the way execvp would
 * @return true if name is an executable path or found in PATH
 */
bool executable_available(const std::string& name);

} // namespace action
} // namespace gest
