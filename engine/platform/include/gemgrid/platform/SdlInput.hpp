#pragma once

#include <SDL2/SDL.h>

#include <vector>

#include "gemgrid/platform/InputEvents.hpp"

namespace gemgrid::platform {

class SdlInput {
public:
    SdlInput() = default;
    ~SdlInput();

    bool Initialize(SDL_Window* window);
    void Shutdown();
    std::vector<InputEvent> Poll();

private:
    bool initialized_ = false;
    SDL_Window* window_ = nullptr;
};

}  // namespace gemgrid::platform
