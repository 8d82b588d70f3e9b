#pragma once

#include <optional>
#include <vector>

#include "evaluator.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Tries every claim sequence of up to \c depth plies in turn order.
    ///
    /// The searching punter tries every free river on its own plies, each opponent answers with the
    /// river that raises its own projected score the most. The first strictly best line wins and
    /// the move is its first river. With a single punter claim order does not matter, so sets of
    /// rivers are enumerated in lexicographic id order instead, and the move is the lowest river
    /// of the best set.
    class ESTUARY_API BruteForceSearcher final
    {
    public:
        struct SearchResult final
        {
            std::size_t traversed_nodes = 0;
            std::int64_t score = 0;
            std::optional<Edge> move;
        };

        [[nodiscard]] SearchResult search(const GameState& state, const ProjectedScoreEvaluator& evaluator, int depth);

    private:
        std::size_t nodes_ = 0;
        Punter me_ = 0;
        std::size_t punters_ = 1;
        const ProjectedScoreEvaluator* eval_ = nullptr;
        std::vector<Edge> candidates_;
        std::vector<std::size_t> chosen_;
        std::optional<std::int64_t> best_score_;
        std::size_t best_first_ = 0;

        [[nodiscard]] Punter acting_punter(std::size_t ply) const noexcept;
        [[nodiscard]] const Edge& greedy_reply(const Graph& graph, const std::vector<Edge>& moves, Punter punter) const;
        std::int64_t play_sequence(const Graph& graph, std::size_t remaining, std::size_t ply);
        void enumerate(const Graph& graph, std::size_t start, std::size_t remaining);
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
