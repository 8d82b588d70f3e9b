#include "estuary/arena/simulator.h"

#include <format>
#include <stdexcept>

#include "estuary/core/errors.h"

namespace est
{
    namespace
    {
        void check_move(const Graph& graph, const Strategy& strategy, const Edge& edge)
        {
            if (!graph.contains(edge.id()) || graph.edge(edge.id()) != edge)
                throw InvalidMoveError(std::format( //
                    "Strategy {} picked river {} ({}, {}) which is not on the map", //
                    strategy.name(), edge.id(), edge.u(), edge.v()));
            if (const auto owner = graph.owner(edge.id()))
                throw InvalidMoveError(std::format( //
                    "Strategy {} picked river {} which is already claimed by punter {}", //
                    strategy.name(), edge.id(), *owner));
        }
    } // namespace

    std::vector<Score> simulate(const Graph& graph, const std::span<const std::unique_ptr<Strategy>> strategies,
        const TurnCallback& on_turn, const StepCallback& before_step)
    {
        if (strategies.empty())
            throw std::invalid_argument("At least one strategy is needed for a game");
        const std::size_t punters = strategies.size();
        GameState game = GameState::initial(graph, punters);
        std::vector<StrategyState> states;
        states.reserve(punters);
        for (const auto& strategy : strategies)
            states.push_back(strategy->initialize(graph));

        const std::size_t total_steps = graph.edge_count();
        for (std::size_t step = 0; step < total_steps; step++)
        {
            const std::size_t index = step % punters;
            const auto punter = static_cast<Punter>(index);
            Strategy& strategy = *strategies[index];
            if (before_step)
                before_step(step, punter, strategy);
            game.me = punter;
            game.strategy_state = std::move(states[index]);
            auto [edge, new_state] = strategy.step(game);
            check_move(game.graph, strategy, edge);
            const auto [source, target] = game.graph.original_ends(edge);
            game = apply_claim(game, Claim{.punter = punter, .source = source, .target = target}, std::move(new_state));
            states[index] = std::move(game.strategy_state);
            if (on_turn)
                on_turn(step, punter, strategy, edge);
        }
        return final_scores(game.graph, punters);
    }

    std::vector<Score> final_scores(const Graph& final_graph, const std::size_t punters)
    {
        const DistanceMap full = shortest_paths(final_graph);
        std::vector<Score> scores;
        scores.reserve(punters);
        for (std::size_t i = 0; i < punters; i++)
        {
            const auto punter = static_cast<Punter>(i);
            scores.push_back({.punter = punter, .score = score_of(final_graph, full, punter)});
        }
        return scores;
    }
} // namespace est
