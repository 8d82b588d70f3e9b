#include "estuary/arena/searching_strategy.h"

#include <format>
#include <stdexcept>

#include "estuary/core/errors.h"
#include "strategy_state.h"

namespace est
{
    namespace
    {
        int checked_depth(const int depth)
        {
            if (depth < 1)
                throw std::invalid_argument(std::format("Search depth must be positive, got {}", depth));
            return depth;
        }

        template <typename Searcher>
        StepResult search_step(Searcher& searcher, EvaluatorCache& cache, const GameState& game, const int depth)
        {
            const auto result = searcher.search(game, cache.get(game), depth);
            if (!result.move)
                throw InvalidMoveError("No free river left to claim");
            StrategyState state = game.strategy_state;
            detail::record_search(state, result.traversed_nodes, result.score);
            return {.edge = *result.move, .state = std::move(state)};
        }
    } // namespace

    const ProjectedScoreEvaluator& EvaluatorCache::get(const GameState& game)
    {
        const auto iter = game.strategy_state.find(detail::distances_key);
        if (iter == game.strategy_state.end())
        {
            evaluator_.emplace(game.graph);
            from_state_ = false;
            return *evaluator_;
        }
        const std::size_t vertex_count = game.graph.vertex_count();
        if (!from_state_ || vertex_count != vertex_count_ || iter->second != encoded_)
        {
            evaluator_.emplace(decode_distances(iter->second, vertex_count));
            encoded_ = iter->second;
            vertex_count_ = vertex_count;
            from_state_ = true;
        }
        return *evaluator_;
    }

    BruteForceStrategy::BruteForceStrategy(const int depth):
        depth_(checked_depth(depth)), name_(std::format("brute{}", depth))
    {
    }

    StrategyState BruteForceStrategy::initialize(const Graph& graph) { return detail::initial_search_state(graph); }

    StepResult BruteForceStrategy::step(const GameState& game) { return search_step(searcher_, evaluator_, game, depth_); }

    MinimaxStrategy::MinimaxStrategy(const int depth):
        depth_(checked_depth(depth)), name_(std::format("minimax{}", depth))
    {
    }

    StrategyState MinimaxStrategy::initialize(const Graph& graph) { return detail::initial_search_state(graph); }

    StepResult MinimaxStrategy::step(const GameState& game) { return search_step(searcher_, evaluator_, game, depth_); }
} // namespace est
