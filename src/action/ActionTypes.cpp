#include "gest/action/ActionTypes.hpp"

#include <algorithm>
#include <cctype>

namespace gest {
namespace action {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string button_name(MouseButton button) {
    switch (button) {
        case MouseButton::LEFT: return "left";
        case MouseButton::MIDDLE: return "middle";
        case MouseButton::RIGHT: return "right";
        default: return "invalid";
    }
}

} // namespace

std::string ActionDescriptor::describe() const {
    switch (kind) {
        case ActionKind::KEY_PRESS: {
            std::string combo;
            for (const auto& key : keys) {
                combo += (combo.empty() ? "" : "+") + key;
            }
            return "key " + combo;
        }
        case ActionKind::MOUSE_CLICK:
            return "click " + button_name(button) + " x" + std::to_string(clicks);
        case ActionKind::MOUSE_SCROLL:
            return "scroll " + std::to_string(amount);
        case ActionKind::CUSTOM_COMMAND:
            return "command '" + command + "'";
        default:
            return "invalid";
    }
}

core::Status<ActionError> validate_descriptor(const ActionDescriptor& descriptor) {
    using StatusType = core::Status<ActionError>;

    switch (descriptor.kind) {
        case ActionKind::KEY_PRESS:
            if (descriptor.keys.empty()) {
                return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "key_press needs at least one key");
            }
            for (const auto& key : descriptor.keys) {
                if (key.empty()) {
                    return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "Empty key name");
                }
            }
            break;
        case ActionKind::MOUSE_CLICK:
            if (descriptor.clicks < 1) {
                return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "mouse_click needs clicks >= 1");
            }
            break;
        case ActionKind::MOUSE_SCROLL:
            if (descriptor.amount == 0) {
                return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "mouse_scroll needs a non-zero amount");
            }
            if (descriptor.amount < -MAX_SCROLL_AMOUNT || descriptor.amount > MAX_SCROLL_AMOUNT) {
                return StatusType::failure(ActionError::INVALID_DESCRIPTOR,
                    "mouse_scroll amount must be within +-" + std::to_string(MAX_SCROLL_AMOUNT));
            }
            break;
        case ActionKind::CUSTOM_COMMAND:
            if (descriptor.command.empty()) {
                return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "custom_command needs a command");
            }
            break;
        default:
            return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "Unknown action kind");
    }

    if (descriptor.cooldown_ms < 0) {
        return StatusType::failure(ActionError::INVALID_DESCRIPTOR, "cooldown_ms must be >= 0");
    }
    return StatusType::ok();
}

std::string action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::KEY_PRESS: return "key_press";
        case ActionKind::MOUSE_CLICK: return "mouse_click";
        case ActionKind::MOUSE_SCROLL: return "mouse_scroll";
        case ActionKind::CUSTOM_COMMAND: return "custom_command";
        default: return "invalid";
    }
}

bool parse_action_kind(const std::string& name, ActionKind& kind) {
    const std::string lower = to_lower(name);
    if (lower == "key_press" || lower == "key") {
        kind = ActionKind::KEY_PRESS;
    } else if (lower == "mouse_click" || lower == "click") {
        kind = ActionKind::MOUSE_CLICK;
    } else if (lower == "mouse_scroll" || lower == "scroll") {
        kind = ActionKind::MOUSE_SCROLL;
    } else if (lower == "custom_command" || lower == "command") {
        kind = ActionKind::CUSTOM_COMMAND;
    } else {
        return false;
    }
    return true;
}

bool parse_mouse_button(const std::string& name, MouseButton& button) {
    const std::string lower = to_lower(name);
    if (lower == "left") {
        button = MouseButton::LEFT;
    } else if (lower == "middle") {
        button = MouseButton::MIDDLE;
    } else if (lower == "right") {
        button = MouseButton::RIGHT;
    } else {
        return false;
    }
    return true;
}

std::string action_error_to_string(ActionError error) {
    switch (error) {
        case ActionError::BACKEND_UNAVAILABLE: return "BackendUnavailable";
        case ActionError::INVALID_DESCRIPTOR: return "InvalidDescriptor";
        case ActionError::EXECUTION_FAILED: return "ExecutionFailed";
        default: return "Invalid";
    }
}

} // namespace action
} // namespace gest
