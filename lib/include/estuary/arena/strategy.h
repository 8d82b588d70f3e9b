#pragma once

#include <string_view>

#include "../core/game.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    struct StepResult final
    {
        Edge edge;
        StrategyState state;
    };

    /// \brief A punter's decision procedure.
    ///
    /// Everything a strategy wants to remember between its turns goes into the StrategyState it
    /// returns, which is handed back on its next turn. Several strategies may play in one game.
    class ESTUARY_API Strategy
    {
    public:
        Strategy() noexcept = default;
        virtual ~Strategy() noexcept = default;
        Strategy(const Strategy&) = delete;
        Strategy(Strategy&&) = delete;
        Strategy& operator=(const Strategy&) = delete;
        Strategy& operator=(Strategy&&) = delete;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual StrategyState initialize(const Graph& graph) = 0;

        /// \brief Pick a river among game.graph.unclaimed() for the punter game.me.
        [[nodiscard]] virtual StepResult step(const GameState& game) = 0;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
