#pragma once

#include <functional>
#include <memory>
#include <span>
#include <vector>

#include "strategy.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    using TurnCallback = std::function<void(std::size_t step, Punter punter, const Strategy& strategy, const Edge& edge)>;
    using StepCallback = std::function<void(std::size_t step, Punter punter, const Strategy& strategy)>;

    /// \brief Play a whole game among the strategies and score it.
    ///
    /// The strategy at index i plays as punter i, turns go round robin until every river is claimed.
    /// \param on_turn Invoked after each claim.
    /// \param before_step Invoked before the strategy of each turn is asked for a river.
    /// \returns The final score of every punter, ordered by punter.
    /// \throws InvalidMoveError If a strategy returns a river that is not free.
    [[nodiscard]] ESTUARY_API std::vector<Score> simulate(const Graph& graph,
        std::span<const std::unique_ptr<Strategy>> strategies, const TurnCallback& on_turn = {},
        const StepCallback& before_step = {});

    /// \brief Final scores of all the punters of a finished game.
    [[nodiscard]] ESTUARY_API std::vector<Score> final_scores(const Graph& final_graph, std::size_t punters);
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
