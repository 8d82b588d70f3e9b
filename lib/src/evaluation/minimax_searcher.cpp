#include "estuary/evaluation/minimax_searcher.h"

#include <algorithm>
#include <stdexcept>

namespace est
{
    namespace
    {
        constexpr std::int64_t inf = Bounds<std::int64_t>::inf;
    }

    MinimaxSearcher::SearchResult MinimaxSearcher::search(
        const GameState& state, const ProjectedScoreEvaluator& evaluator, const int depth)
    {
        if (!state.me)
            throw std::invalid_argument("Searching requires the perspective of a punter");
        if (depth < 1)
            throw std::invalid_argument("Search depth must be positive");
        nodes_ = 0;
        me_ = *state.me;
        punters_ = std::max<std::size_t>(state.punters, 1);
        eval_ = &evaluator;
        tt_.clear();

        const std::vector<Edge> moves = state.graph.unclaimed();
        if (moves.empty())
            return {.traversed_nodes = 1, .score = eval_->evaluate(state.graph, me_), .move = std::nullopt};
        SearchResult res;
        for (const Edge& edge : moves)
        {
            const Graph child = state.graph.claim(me_, edge.id());
            if (const std::int64_t score = alpha_beta(child, res.score, inf, depth - 1, 1); //
                score > res.score)
            {
                res.score = score;
                res.move = edge;
            }
        }
        res.traversed_nodes = nodes_;
        return res;
    }

    Punter MinimaxSearcher::acting_punter(const std::size_t ply) const noexcept
    {
        return static_cast<Punter>((static_cast<std::size_t>(me_) + ply) % punters_);
    }

    std::int64_t MinimaxSearcher::alpha_beta(
        const Graph& graph, std::int64_t alpha, std::int64_t beta, const int depth, const std::size_t ply)
    {
        nodes_++;
        const std::vector<Edge> moves = graph.unclaimed();
        if (depth == 0 || moves.empty())
            return eval_->evaluate(graph, me_);

        const ClaimKey key = claim_key_of(graph);
        const std::size_t hash = tt_.hash(key);
        Bounds<std::int64_t> bounds{};
        if (const auto* ptr = tt_.try_load(key, depth, hash))
        {
            bounds = *ptr;
            if (bounds.upper <= alpha) // alpha-cut
                return bounds.upper;
            if (bounds.lower >= beta) // beta-cut
                return bounds.lower;
            if (bounds.exact())
                return bounds.lower;
            alpha = std::max(alpha, bounds.lower);
            beta = std::min(beta, bounds.upper);
        }

        const Punter acting = acting_punter(ply);
        const bool maximizing = acting == me_;
        std::int64_t score = maximizing ? -inf : inf;
        for (const Edge& edge : moves)
        {
            const Graph child = graph.claim(acting, edge.id());
            if (maximizing)
            {
                const std::int64_t child_score = alpha_beta(child, std::max(alpha, score), beta, depth - 1, ply + 1);
                if (child_score > score)
                {
                    score = child_score;
                    if (score >= beta) // beta-cut
                        break;
                }
            }
            else
            {
                const std::int64_t child_score = alpha_beta(child, alpha, std::min(beta, score), depth - 1, ply + 1);
                if (child_score < score)
                {
                    score = child_score;
                    if (score <= alpha) // alpha-cut
                        break;
                }
            }
        }

        if (score <= alpha)
            tt_.store(key, depth, {bounds.lower, score}, hash);
        else if (score >= beta)
            tt_.store(key, depth, {score, bounds.upper}, hash);
        else
            tt_.store(key, depth, score, hash);
        return score;
    }
} // namespace est
