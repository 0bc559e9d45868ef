#include "gemgrid/platform/SdlInput.hpp"

#include <SDL2/SDL.h>

namespace gemgrid::platform {

namespace {

MouseButton ToMouseButton(Uint8 button) {
    switch (button) {
        case SDL_BUTTON_LEFT:
            return MouseButton::Left;
        case SDL_BUTTON_RIGHT:
            return MouseButton::Right;
        case SDL_BUTTON_MIDDLE:
            return MouseButton::Middle;
        default:
            return MouseButton::Unknown;
    }
}

KeyCode ToKey(SDL_Keycode key) {
    switch (key) {
        case SDLK_ESCAPE:
            return KeyCode::Escape;
        case SDLK_r:
            return KeyCode::R;
        case SDLK_SPACE:
            return KeyCode::Space;
        default:
            return KeyCode::Unknown;
    }
}

}  // namespace

SdlInput::~SdlInput() {
    Shutdown();
}

bool SdlInput::Initialize(SDL_Window* window) {
    if (initialized_) {
        return true;
    }
    if (!window) {
        SDL_SetError("SdlInput needs a window to scale touch positions");
        return false;
    }
    window_ = window;
    // Touches are reported as FingerUp; synthesized mouse clicks would pick twice.
    SDL_SetHint(SDL_HINT_TOUCH_MOUSE_EVENTS, "0");
    initialized_ = true;
    return true;
}

void SdlInput::Shutdown() {
    window_ = nullptr;
    initialized_ = false;
}

std::vector<InputEvent> SdlInput::Poll() {
    std::vector<InputEvent> events;
    SDL_Event sdl_event;
    while (SDL_PollEvent(&sdl_event)) {
        InputEvent evt;
        switch (sdl_event.type) {
            case SDL_QUIT:
                evt.type = InputEventType::Quit;
                events.push_back(evt);
                break;
            case SDL_MOUSEBUTTONDOWN:
                if (sdl_event.button.which == SDL_TOUCH_MOUSEID) {
                    break;
                }
                evt.type = InputEventType::MouseButtonDown;
                evt.x = static_cast<float>(sdl_event.button.x);
                evt.y = static_cast<float>(sdl_event.button.y);
                evt.mouse_button = ToMouseButton(sdl_event.button.button);
                events.push_back(evt);
                break;
            case SDL_FINGERUP: {
                int w = 0;
                int h = 0;
                if (window_) {
                    SDL_GetWindowSize(window_, &w, &h);
                }
                evt.type = InputEventType::FingerUp;
                evt.x = sdl_event.tfinger.x * static_cast<float>(w);
                evt.y = sdl_event.tfinger.y * static_cast<float>(h);
                events.push_back(evt);
                break;
            }
            case SDL_KEYDOWN:
                if (sdl_event.key.repeat != 0) {
                    break;
                }
                evt.type = InputEventType::KeyDown;
                evt.key = ToKey(sdl_event.key.keysym.sym);
                events.push_back(evt);
                break;
            case SDL_WINDOWEVENT:
                if (sdl_event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    evt.type = InputEventType::WindowResized;
                    events.push_back(evt);
                }
                break;
            default:
                break;
        }
    }
    return events;
}

}  // namespace gemgrid::platform
