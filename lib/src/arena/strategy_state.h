#pragma once

#include "estuary/core/game.h"

namespace est::detail
{
    inline constexpr const char* distances_key = "distances";
    inline constexpr const char* turns_key = "turns";
    inline constexpr const char* nodes_key = "nodes";
    inline constexpr const char* projected_key = "projected";

    [[nodiscard]] std::size_t turns_of(const StrategyState& state);

    [[nodiscard]] StrategyState initial_search_state(const Graph& graph);

    void record_turn(StrategyState& state);
    void record_search(StrategyState& state, std::size_t nodes, std::int64_t projected);
} // namespace est::detail
