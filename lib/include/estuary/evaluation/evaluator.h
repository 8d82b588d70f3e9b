#pragma once

#include "../core/game.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Scores a partially claimed graph as if the game ended right there.
    ///
    /// Distances over the whole graph do not depend on the claims, so they are computed once
    /// and only the reachability through the punter's own rivers is recomputed per evaluation.
    class ESTUARY_API ProjectedScoreEvaluator final
    {
    public:
        explicit ProjectedScoreEvaluator(DistanceMap full_distances) noexcept: full_(std::move(full_distances)) {}
        explicit ProjectedScoreEvaluator(const Graph& graph): full_(shortest_paths(graph)) {}

        [[nodiscard]] std::int64_t evaluate(const Graph& graph, Punter punter) const;
        [[nodiscard]] const DistanceMap& full_distances() const noexcept { return full_; }

    private:
        DistanceMap full_;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
