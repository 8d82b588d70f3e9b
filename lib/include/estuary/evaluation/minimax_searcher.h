#pragma once

#include <optional>

#include "evaluator.h"
#include "transposition_table.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Depth-limited alpha-beta search over the claim order.
    ///
    /// Plies follow the turn order of the game. The searching punter maximizes its projected score,
    /// every other punter is modeled as an adversary minimizing it on its own ply.
    class ESTUARY_API MinimaxSearcher final
    {
    public:
        struct SearchResult final
        {
            std::size_t traversed_nodes = 0;
            std::int64_t score = -Bounds<std::int64_t>::inf;
            std::optional<Edge> move;
        };

        /// \brief Find the best river for the punter \p state.me.
        /// \returns The projected score of the principal line, with no move if every river is claimed.
        [[nodiscard]] SearchResult search(const GameState& state, const ProjectedScoreEvaluator& evaluator, int depth);
        [[nodiscard]] const auto& transposition_table() const noexcept { return tt_; }

    private:
        std::size_t nodes_ = 0;
        Punter me_ = 0;
        std::size_t punters_ = 1;
        const ProjectedScoreEvaluator* eval_ = nullptr;
        TranspositionTable<std::int64_t> tt_;

        [[nodiscard]] Punter acting_punter(std::size_t ply) const noexcept;
        std::int64_t alpha_beta(const Graph& graph, std::int64_t alpha, std::int64_t beta, int depth, std::size_t ply);
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
