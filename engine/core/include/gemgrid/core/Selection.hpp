#pragma once

#include <optional>
#include <variant>

#include "gemgrid/core/Board.hpp"
#include "gemgrid/core/Types.hpp"

namespace gemgrid::core {

enum class SwapAxis { Horizontal, Vertical, Invalid };

struct SwapThresholds {
    float self_distance = 0.5f;
    float neighbor_distance = 1.5f;
};

struct SwapSettings {
    bool animated = true;
    float duration = 0.5f;
    SwapThresholds thresholds{};
};

// Throws std::invalid_argument for a non-positive duration or thresholds that
// leave no room for a neighbour.
void ValidateSwapSettings(const SwapSettings& settings);

// A pick is a swap candidate along one axis when its distance on that axis is
// strictly between the self and neighbour thresholds and the other axis stays
// within the self threshold.
SwapAxis ClassifySwap(const Vec2& from, const Vec2& to,
                      const SwapThresholds& thresholds = SwapThresholds{});
SwapAxis ClassifySwap(const Cell& from, const Cell& to,
                      const SwapThresholds& thresholds = SwapThresholds{});

const char* SwapAxisName(SwapAxis axis) noexcept;

struct TileHit {
    Cell cell{};
    Vec2 position{};
};

// Screen point to tile lookup, owned by the rendering layer.
class TileHitResolver {
public:
    virtual ~TileHitResolver() = default;
    virtual std::optional<TileHit> Resolve(const Vec2& screen_point) const = 0;
};

// Appearance requests issued by the controller.
class TileVisualSink {
public:
    virtual ~TileVisualSink() = default;
    virtual void SetHighlighted(const Cell& cell, bool highlighted) = 0;
    virtual void SetTilePosition(const Cell& cell, const Vec2& position) = 0;
    // The visuals of a and b trade board coordinates after an animated swap.
    virtual void SwapTiles(const Cell& a, const Cell& b) = 0;
};

struct PointerEvent {
    std::optional<Vec2> screen_position;
};

struct SwapOperation {
    Cell origin{};
    Cell target{};
    SwapAxis axis = SwapAxis::Invalid;
    float elapsed = 0.0f;  // seconds since the swap started
    float duration = 0.0f;
    float distance = 0.0f;
    Vec2 origin_start{};
    Vec2 target_start{};

    Vec2 originPositionAt(float ratio) const { return Lerp(origin_start, target_start, ratio); }
    Vec2 targetPositionAt(float ratio) const { return Lerp(target_start, origin_start, ratio); }
};

struct IdleState {};

struct SelectedState {
    TileHit tile{};
};

struct SwappingState {
    SwapOperation operation{};
};

using SelectionState = std::variant<IdleState, SelectedState, SwappingState>;

enum class InputOutcome {
    Ignored,     // no position, or a swap is animating
    Missed,      // no tile under the pointer
    Selected,    // Idle -> Selected
    Unchanged,   // picked the tile that is already selected
    Reselected,  // not a neighbour; the pick becomes the selection
    Swapped,     // instant swap committed
    SwapStarted  // animated swap in flight
};

struct StateTransition {
    InputOutcome outcome = InputOutcome::Ignored;
    SwapAxis axis = SwapAxis::Invalid;
};

enum class TickOutcome { Idle, Animating, Completed };

class SelectionController {
public:
    SelectionController(Board& board,
                        const TileHitResolver& resolver,
                        TileVisualSink& sink,
                        SwapSettings settings = SwapSettings{});

    StateTransition OnInput(const PointerEvent& event);
    TickOutcome OnTick(float delta_seconds);

    // Drops the current selection. Returns false while a swap is animating,
    // since swaps always run to completion.
    bool Reset();

    bool SetAnimated(bool animated);

    const SelectionState& state() const noexcept { return state_; }
    std::optional<Cell> selected() const;
    bool swapping() const noexcept { return std::holds_alternative<SwappingState>(state_); }
    const SwapOperation* activeSwap() const;
    const SwapSettings& settings() const noexcept { return settings_; }

private:
    StateTransition HandlePick(const TileHit& hit);

    Board& board_;
    const TileHitResolver& resolver_;
    TileVisualSink& sink_;
    SwapSettings settings_{};
    SelectionState state_{IdleState{}};
};

}  // namespace gemgrid::core
