#include "estuary/arena/lowest_edge_strategy.h"
#include "estuary/core/errors.h"

#include "strategy_state.h"

namespace est
{
    StrategyState LowestEdgeStrategy::initialize(const Graph&) { return {{detail::turns_key, "0"}}; }

    StepResult LowestEdgeStrategy::step(const GameState& game)
    {
        const std::vector<Edge> edges = game.graph.unclaimed();
        if (edges.empty())
            throw InvalidMoveError("No free river left to claim");
        StrategyState state = game.strategy_state;
        detail::record_turn(state);
        return {.edge = edges.front(), .state = std::move(state)};
    }
} // namespace est
