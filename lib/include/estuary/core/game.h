#pragma once

#include <map>
#include <optional>
#include <string>

#include "graph.h"
#include "move.h"
#include "traversal.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Private data of a strategy, relayed between its turns without being inspected.
    using StrategyState = std::map<std::string, std::string>;

    struct ESTUARY_API GameState final
    {
        Graph graph;
        std::optional<Punter> me; ///< Perspective used by strategies for decision making
        std::size_t punters = 0;
        StrategyState strategy_state;

        [[nodiscard]] static GameState initial(const Graph& graph, std::size_t punters);
    };

    /// \brief Apply a claim, replacing the strategy state with \p strategy_state.
    /// \throws UnknownEdgeError If no river joins the two sites of the claim.
    /// \throws AlreadyClaimedError If the river already has an owner.
    [[nodiscard]] ESTUARY_API GameState apply_claim(
        const GameState& state, const Claim& claim, StrategyState strategy_state);

    /// \brief Apply any move, a pass leaves the graph as it is.
    [[nodiscard]] ESTUARY_API GameState apply_move(
        const GameState& state, const Move& move, StrategyState strategy_state);

    /// \brief Score of one punter.
    /// \param final_graph The graph at the end of the game.
    /// \param full_distances Distances from each mine over the whole graph.
    /// \param owned_distances Distances from each mine over the subgraph owned by the punter.
    [[nodiscard]] ESTUARY_API std::int64_t score(
        const Graph& final_graph, const DistanceMap& full_distances, const DistanceMap& owned_distances);

    [[nodiscard]] ESTUARY_API std::int64_t score_of(
        const Graph& final_graph, const DistanceMap& full_distances, Punter punter);
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
