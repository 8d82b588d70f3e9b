#include "estuary/evaluation/brute_force_searcher.h"

#include <algorithm>
#include <stdexcept>

namespace est
{
    BruteForceSearcher::SearchResult BruteForceSearcher::search(
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
        candidates_ = state.graph.unclaimed();
        chosen_.clear();
        best_score_.reset();
        best_first_ = 0;

        if (candidates_.empty())
            return {.traversed_nodes = 1, .score = eval_->evaluate(state.graph, me_), .move = std::nullopt};
        const std::size_t plies = std::min(static_cast<std::size_t>(depth), candidates_.size());

        if (punters_ == 1)
        {
            enumerate(state.graph, 0, plies);
            return {.traversed_nodes = nodes_, .score = *best_score_, .move = candidates_[best_first_]};
        }

        for (std::size_t i = 0; i < candidates_.size(); i++)
        {
            const Graph child = state.graph.claim(me_, candidates_[i].id());
            if (const std::int64_t score = play_sequence(child, plies - 1, 1); !best_score_ || score > *best_score_)
            {
                best_score_ = score;
                best_first_ = i;
            }
        }
        return {.traversed_nodes = nodes_, .score = *best_score_, .move = candidates_[best_first_]};
    }

    Punter BruteForceSearcher::acting_punter(const std::size_t ply) const noexcept
    {
        return static_cast<Punter>((static_cast<std::size_t>(me_) + ply) % punters_);
    }

    const Edge& BruteForceSearcher::greedy_reply(
        const Graph& graph, const std::vector<Edge>& moves, const Punter punter) const
    {
        const Edge* best = &moves.front();
        std::optional<std::int64_t> best_score;
        for (const Edge& edge : moves)
        {
            if (const std::int64_t score = eval_->evaluate(graph.claim(punter, edge.id()), punter);
                !best_score || score > *best_score)
            {
                best_score = score;
                best = &edge;
            }
        }
        return *best;
    }

    std::int64_t BruteForceSearcher::play_sequence(const Graph& graph, const std::size_t remaining, const std::size_t ply)
    {
        const std::vector<Edge> moves = graph.unclaimed();
        if (remaining == 0 || moves.empty())
        {
            nodes_++;
            return eval_->evaluate(graph, me_);
        }

        const Punter acting = acting_punter(ply);
        if (acting != me_)
        {
            const Edge& reply = greedy_reply(graph, moves, acting);
            return play_sequence(graph.claim(acting, reply.id()), remaining - 1, ply + 1);
        }

        std::optional<std::int64_t> best;
        for (const Edge& edge : moves)
            if (const std::int64_t score = play_sequence(graph.claim(me_, edge.id()), remaining - 1, ply + 1);
                !best || score > *best)
                best = score;
        return *best;
    }

    void BruteForceSearcher::enumerate(const Graph& graph, const std::size_t start, const std::size_t remaining)
    {
        if (remaining == 0)
        {
            nodes_++;
            if (const std::int64_t score = eval_->evaluate(graph, me_); !best_score_ || score > *best_score_)
            {
                best_score_ = score;
                best_first_ = chosen_.front();
            }
            return;
        }
        for (std::size_t i = start; i + remaining <= candidates_.size(); i++)
        {
            chosen_.push_back(i);
            enumerate(graph.claim(me_, candidates_[i].id()), i + 1, remaining - 1);
            chosen_.pop_back();
        }
    }
} // namespace est
