#pragma once

namespace gemgrid::platform {

enum class InputEventType {
    Quit,
    MouseButtonDown,
    FingerUp,
    KeyDown,
    WindowResized
};

enum class MouseButton { Left, Right, Middle, Unknown };

enum class KeyCode { Escape, R, Space, Unknown };

struct InputEvent {
    InputEventType type = InputEventType::Quit;
    float x = 0.0f;  // window pixels
    float y = 0.0f;
    MouseButton mouse_button = MouseButton::Unknown;
    KeyCode key = KeyCode::Unknown;
};

}  // namespace gemgrid::platform
