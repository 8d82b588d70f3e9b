#include <gtest/gtest.h>

#include <estuary/arena/lowest_edge_strategy.h>
#include <estuary/arena/searching_strategy.h>
#include <estuary/core/errors.h>

namespace
{
    est::GameState make_fork_game(const est::Punter me)
    {
        auto state = est::GameState::initial(est::Graph::create(4, {0}, {{0, 1}, {0, 2}, {2, 3}}), 2);
        state.me = me;
        return state;
    }
} // namespace

TEST(LowestEdgeStrategy, PicksLowestFreeRiver)
{
    est::LowestEdgeStrategy strategy;
    EXPECT_EQ(strategy.name(), "lowest");
    auto game = make_fork_game(0);
    game.strategy_state = strategy.initialize(game.graph);
    EXPECT_EQ(game.strategy_state.at("turns"), "0");

    auto [edge, state] = strategy.step(game);
    EXPECT_EQ(edge.id(), 0u);
    EXPECT_EQ(state.at("turns"), "1");

    game.graph = game.graph.claim(1, 0);
    game.strategy_state = state;
    const auto second = strategy.step(game);
    EXPECT_EQ(second.edge.id(), 1u);
    EXPECT_EQ(second.state.at("turns"), "2");
}

TEST(LowestEdgeStrategy, FailsWithoutFreeRivers)
{
    est::LowestEdgeStrategy strategy;
    auto game = make_fork_game(0);
    game.graph = game.graph.claim(0, 0).claim(0, 1).claim(0, 2);
    EXPECT_THROW((void)strategy.step(game), est::InvalidMoveError);
}

TEST(SearchingStrategy, Names)
{
    EXPECT_EQ(est::BruteForceStrategy(3).name(), "brute3");
    EXPECT_EQ(est::MinimaxStrategy(2).name(), "minimax2");
    EXPECT_EQ(est::MinimaxStrategy(2).depth(), 2);
    EXPECT_THROW((void)est::BruteForceStrategy(0), std::invalid_argument);
    EXPECT_THROW((void)est::MinimaxStrategy(-1), std::invalid_argument);
}

TEST(SearchingStrategy, InitializeCachesDistances)
{
    est::BruteForceStrategy strategy(2);
    const auto game = make_fork_game(0);
    const auto state = strategy.initialize(game.graph);
    EXPECT_EQ(state.at("distances"), est::encode_distances(est::shortest_paths(game.graph)));
    EXPECT_EQ(state.at("turns"), "0");
}

TEST(SearchingStrategy, BruteForceStep)
{
    est::BruteForceStrategy strategy(2);
    auto game = make_fork_game(0);
    game.strategy_state = strategy.initialize(game.graph);
    const auto [edge, state] = strategy.step(game);
    EXPECT_EQ(edge.id(), 0u); // The opponent would take river 0 right after river 1
    EXPECT_EQ(state.at("turns"), "1");
    EXPECT_EQ(state.at("projected"), "1");
    EXPECT_EQ(state.at("nodes"), "3");
    EXPECT_EQ(state.at("distances"), game.strategy_state.at("distances"));
}

TEST(SearchingStrategy, MinimaxStep)
{
    est::MinimaxStrategy strategy(3);
    auto game = make_fork_game(0);
    game.strategy_state = strategy.initialize(game.graph);
    const auto [edge, state] = strategy.step(game);
    EXPECT_EQ(edge.id(), 1u);
    EXPECT_EQ(state.at("projected"), "2");
    EXPECT_EQ(state.at("turns"), "1");
}

TEST(SearchingStrategy, WorksWithoutCachedDistances)
{
    est::MinimaxStrategy strategy(1);
    const auto game = make_fork_game(0);
    const auto [edge, state] = strategy.step(game);
    EXPECT_EQ(edge.id(), 0u);
    EXPECT_EQ(state.at("turns"), "1");
    EXPECT_FALSE(state.contains("distances"));
}

TEST(SearchingStrategy, RejectsCorruptedState)
{
    est::BruteForceStrategy strategy(1);
    auto game = make_fork_game(0);
    game.strategy_state = {{"distances", "0:0,1"}};
    EXPECT_THROW((void)strategy.step(game), std::runtime_error);
    game.strategy_state = {{"turns", "many"}};
    EXPECT_THROW((void)strategy.step(game), std::runtime_error);
}

TEST(SearchingStrategy, FailsWithoutFreeRivers)
{
    est::MinimaxStrategy strategy(2);
    auto game = make_fork_game(0);
    game.graph = game.graph.claim(0, 0).claim(1, 1).claim(0, 2);
    EXPECT_THROW((void)strategy.step(game), est::InvalidMoveError);
}

TEST(EvaluatorCache, DecodesOnlyWhenTheCacheChanges)
{
    est::EvaluatorCache cache;
    auto game = make_fork_game(0);
    game.strategy_state = {{"distances", est::encode_distances(est::shortest_paths(game.graph))}};
    const auto& first = cache.get(game);
    EXPECT_EQ(first.full_distances(), est::shortest_paths(game.graph));

    // Claims do not touch the full graph distances, the same table keeps serving
    game.graph = game.graph.claim(1, 0);
    EXPECT_EQ(&cache.get(game), &first);
    EXPECT_EQ(first.evaluate(game.graph.claim(0, 1), 0), 1);

    // Another cache text replaces the table
    game.strategy_state = {{"distances", "0:0,-,-,-"}};
    const auto& replaced = cache.get(game);
    EXPECT_FALSE(replaced.full_distances().at(0)[1].has_value());
    EXPECT_EQ(replaced.evaluate(game.graph.claim(0, 1), 0), 0);
}

TEST(EvaluatorCache, ComputesDistancesWithoutCache)
{
    est::EvaluatorCache cache;
    auto game = make_fork_game(0);
    game.strategy_state = {{"distances", "0:0,-,-,-"}};
    (void)cache.get(game);
    game.strategy_state.clear();
    EXPECT_EQ(cache.get(game).full_distances(), est::shortest_paths(game.graph));
}
