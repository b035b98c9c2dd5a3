/**
 * @file ActionTypes.hpp
 * @brief Action descriptors, mapping table and action errors
 */

#ifndef GEST_ACTION_TYPES_HPP
#define GEST_ACTION_TYPES_HPP

#include <map>
#include <string>
#include <vector>
#include "gest/core/types.hpp"

namespace gest {
namespace action {

enum class ActionKind {
    KEY_PRESS,       ///< Key combination, e.g. {"ctrl", "c"}
    MOUSE_CLICK,     ///< Button and click count
    MOUSE_SCROLL,    ///< Signed amount; positive scrolls up
    CUSTOM_COMMAND   ///< Shell command line
};

enum class MouseButton {
    LEFT = 1,
    MIDDLE = 2,
    RIGHT = 3
};

enum class ActionError {
    BACKEND_UNAVAILABLE,   ///< Backend cannot run (tool missing, no display)
    INVALID_DESCRIPTOR,    ///< Descriptor fields do not fit its kind
    EXECUTION_FAILED       ///< Backend ran and reported failure
};

/// Largest scroll step count in either direction
constexpr int MAX_SCROLL_AMOUNT = 100;

/**
 * @brief What to do when a gesture is confirmed
 */
struct ActionDescriptor {
    ActionKind kind = ActionKind::KEY_PRESS;
    std::vector<std::string> keys;
    MouseButton button = MouseButton::LEFT;
    int clicks = 1;
    int amount = 0;
    std::string command;
    int cooldown_ms = 0;   ///< Minimum interval between two runs of this action

    std::string describe() const;
};

/// Label -> action, loaded once from configuration
using ActionMapping = std::map<std::string, ActionDescriptor>;

/**
 * @brief Check that the fields required by the descriptor's kind are usable
 */
core::Status<ActionError> validate_descriptor(const ActionDescriptor& descriptor);

std::string action_kind_to_string(ActionKind kind);

/**
 * @brief Parse "key_press", "mouse_click", "mouse_scroll", "custom_command"
 */
bool parse_action_kind(const std::string& name, ActionKind& kind);

/**
 * @brief Parse "left", "middle", "right"
 */
bool parse_mouse_button(const std::string& name, MouseButton& button);

std::string action_error_to_string(ActionError error);

} // namespace action
} // namespace gest

#endif // GEST_ACTION_TYPES_HPP
