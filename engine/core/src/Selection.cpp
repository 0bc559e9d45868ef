#include "gemgrid/core/Selection.hpp"

#include <cmath>
#include <stdexcept>

namespace gemgrid::core {

namespace {

bool WithinNeighborBand(float delta, const SwapThresholds& thresholds) {
    return delta > thresholds.self_distance && delta < thresholds.neighbor_distance;
}

}  // namespace

void ValidateSwapSettings(const SwapSettings& settings) {
    if (!(settings.duration > 0.0f)) {
        throw std::invalid_argument("swap duration must be positive");
    }
    if (settings.thresholds.self_distance < 0.0f ||
        settings.thresholds.self_distance >= settings.thresholds.neighbor_distance) {
        throw std::invalid_argument(
            "self_distance must be non-negative and below neighbor_distance");
    }
}

SwapAxis ClassifySwap(const Vec2& from, const Vec2& to, const SwapThresholds& thresholds) {
    const float dx = std::fabs(from.x - to.x);
    const float dy = std::fabs(from.y - to.y);
    if (WithinNeighborBand(dx, thresholds) && dy <= thresholds.self_distance) {
        return SwapAxis::Horizontal;
    }
    if (WithinNeighborBand(dy, thresholds) && dx <= thresholds.self_distance) {
        return SwapAxis::Vertical;
    }
    return SwapAxis::Invalid;
}

SwapAxis ClassifySwap(const Cell& from, const Cell& to, const SwapThresholds& thresholds) {
    return ClassifySwap(Vec2{static_cast<float>(from.col), static_cast<float>(from.row)},
                        Vec2{static_cast<float>(to.col), static_cast<float>(to.row)},
                        thresholds);
}

const char* SwapAxisName(SwapAxis axis) noexcept {
    switch (axis) {
        case SwapAxis::Horizontal:
            return "horizontal";
        case SwapAxis::Vertical:
            return "vertical";
        case SwapAxis::Invalid:
        default:
            return "invalid";
    }
}

SelectionController::SelectionController(Board& board,
                                         const TileHitResolver& resolver,
                                         TileVisualSink& sink,
                                         SwapSettings settings)
    : board_(board), resolver_(resolver), sink_(sink), settings_(settings) {
    ValidateSwapSettings(settings_);
}

StateTransition SelectionController::OnInput(const PointerEvent& event) {
    if (swapping() || !event.screen_position) {
        return StateTransition{InputOutcome::Ignored, SwapAxis::Invalid};
    }
    auto hit = resolver_.Resolve(*event.screen_position);
    if (!hit) {
        return StateTransition{InputOutcome::Missed, SwapAxis::Invalid};
    }
    return HandlePick(*hit);
}

StateTransition SelectionController::HandlePick(const TileHit& hit) {
    if (std::holds_alternative<IdleState>(state_)) {
        sink_.SetHighlighted(hit.cell, true);
        state_ = SelectedState{hit};
        return StateTransition{InputOutcome::Selected, SwapAxis::Invalid};
    }

    const TileHit current = std::get<SelectedState>(state_).tile;
    if (current.cell == hit.cell) {
        return StateTransition{InputOutcome::Unchanged, SwapAxis::Invalid};
    }

    const SwapAxis axis = ClassifySwap(current.position, hit.position, settings_.thresholds);
    sink_.SetHighlighted(current.cell, false);

    if (axis == SwapAxis::Invalid) {
        sink_.SetHighlighted(hit.cell, true);
        state_ = SelectedState{hit};
        return StateTransition{InputOutcome::Reselected, axis};
    }

    if (!settings_.animated) {
        board_.swapCells(current.cell, hit.cell);
        state_ = IdleState{};
        return StateTransition{InputOutcome::Swapped, axis};
    }

    SwapOperation operation;
    operation.origin = current.cell;
    operation.target = hit.cell;
    operation.axis = axis;
    operation.duration = settings_.duration;
    operation.distance = axis == SwapAxis::Horizontal
                             ? std::fabs(current.position.x - hit.position.x)
                             : std::fabs(current.position.y - hit.position.y);
    operation.origin_start = current.position;
    operation.target_start = hit.position;
    state_ = SwappingState{operation};
    return StateTransition{InputOutcome::SwapStarted, axis};
}

TickOutcome SelectionController::OnTick(float delta_seconds) {
    auto* swapping_state = std::get_if<SwappingState>(&state_);
    if (!swapping_state) {
        return TickOutcome::Idle;
    }

    SwapOperation& operation = swapping_state->operation;
    operation.elapsed += delta_seconds;
    const float elapsed = operation.elapsed;
    // Not clamped: the completing frame may carry the tiles slightly past each other.
    const float ratio = elapsed / operation.duration;
    sink_.SetTilePosition(operation.origin, operation.originPositionAt(ratio));
    sink_.SetTilePosition(operation.target, operation.targetPositionAt(ratio));

    if (elapsed <= operation.duration) {
        return TickOutcome::Animating;
    }

    const Cell origin = operation.origin;
    const Cell target = operation.target;
    board_.swapCells(origin, target);
    sink_.SwapTiles(origin, target);
    state_ = IdleState{};
    return TickOutcome::Completed;
}

bool SelectionController::Reset() {
    if (swapping()) {
        return false;
    }
    if (const auto* selected_state = std::get_if<SelectedState>(&state_)) {
        sink_.SetHighlighted(selected_state->tile.cell, false);
    }
    state_ = IdleState{};
    return true;
}

bool SelectionController::SetAnimated(bool animated) {
    if (swapping()) {
        return false;
    }
    settings_.animated = animated;
    return true;
}

std::optional<Cell> SelectionController::selected() const {
    if (const auto* selected_state = std::get_if<SelectedState>(&state_)) {
        return selected_state->tile.cell;
    }
    return std::nullopt;
}

const SwapOperation* SelectionController::activeSwap() const {
    if (const auto* swapping_state = std::get_if<SwappingState>(&state_)) {
        return &swapping_state->operation;
    }
    return nullptr;
}

}  // namespace gemgrid::core
