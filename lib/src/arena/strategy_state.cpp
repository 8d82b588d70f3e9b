#include "strategy_state.h"

#include <format>
#include <stdexcept>
#include <clu/parse.h>

namespace est::detail
{
    std::size_t turns_of(const StrategyState& state)
    {
        const auto iter = state.find(turns_key);
        if (iter == state.end())
            return 0;
        const auto turns = clu::parse<std::size_t>(iter->second);
        if (!turns)
            throw std::runtime_error(std::format("Corrupted strategy state, turns = \"{}\"", iter->second));
        return *turns;
    }

    StrategyState initial_search_state(const Graph& graph)
    {
        return {
            {distances_key, encode_distances(shortest_paths(graph))},
            {turns_key, "0"} //
        };
    }

    void record_turn(StrategyState& state) { state[turns_key] = std::to_string(turns_of(state) + 1); }

    void record_search(StrategyState& state, const std::size_t nodes, const std::int64_t projected)
    {
        record_turn(state);
        state[nodes_key] = std::to_string(nodes);
        state[projected_key] = std::to_string(projected);
    }
} // namespace est::detail
