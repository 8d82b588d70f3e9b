#include "estuary/core/game.h"

#include <algorithm>
#include <format>

#include "estuary/core/errors.h"

namespace est
{
    GameState GameState::initial(const Graph& graph, const std::size_t punters)
    {
        return {.graph = graph, .me = std::nullopt, .punters = punters, .strategy_state = {}};
    }

    GameState apply_claim(const GameState& state, const Claim& claim, StrategyState strategy_state)
    {
        const Edge* edge = nullptr;
        try
        {
            edge = &state.graph.from_original_ends(claim.source, claim.target);
        }
        catch (const NotFoundError& e)
        {
            throw UnknownEdgeError(std::format("Punter {} claimed an unknown river: {}", claim.punter, e.what()));
        }
        return {
            .graph = state.graph.claim(claim.punter, edge->id()),
            .me = state.me,
            .punters = state.punters,
            .strategy_state = std::move(strategy_state) //
        };
    }

    GameState apply_move(const GameState& state, const Move& move, StrategyState strategy_state)
    {
        if (const auto* claim = std::get_if<Claim>(&move))
            return apply_claim(state, *claim, std::move(strategy_state));
        GameState res = state;
        res.strategy_state = std::move(strategy_state);
        return res;
    }

    std::int64_t score(const Graph& final_graph, const DistanceMap& full_distances, const DistanceMap& owned_distances)
    {
        std::int64_t total = 0;
        for (const VertexId mine : final_graph.mines())
        {
            const auto full = full_distances.find(mine);
            const auto owned = owned_distances.find(mine);
            if (full == full_distances.end() || owned == owned_distances.end())
                continue;
            const DistanceTable& full_table = full->second;
            const DistanceTable& owned_table = owned->second;
            const std::size_t n = std::min(full_table.size(), owned_table.size());
            for (std::size_t v = 0; v < n; v++)
            {
                // Reachable through owned rivers implies reachable in the full graph
                if (!owned_table[v] || !full_table[v])
                    continue;
                const auto d = static_cast<std::int64_t>(*full_table[v]);
                total += d * d;
            }
        }
        return total;
    }

    std::int64_t score_of(const Graph& final_graph, const DistanceMap& full_distances, const Punter punter)
    {
        return score(final_graph, full_distances, shortest_paths(final_graph.subgraph(punter)));
    }
} // namespace est
