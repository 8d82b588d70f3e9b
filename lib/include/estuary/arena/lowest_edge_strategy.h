#pragma once

#include "strategy.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Always claims the free river with the lowest id.
    class ESTUARY_API LowestEdgeStrategy final : public Strategy
    {
    public:
        [[nodiscard]] std::string_view name() const noexcept override { return "lowest"; }
        [[nodiscard]] StrategyState initialize(const Graph& graph) override;
        [[nodiscard]] StepResult step(const GameState& game) override;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
