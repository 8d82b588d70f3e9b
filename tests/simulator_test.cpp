#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <optional>
#include <string>

#include <estuary/arena/lowest_edge_strategy.h>
#include <estuary/arena/searching_strategy.h>
#include <estuary/arena/simulator.h>
#include <estuary/core/errors.h>
#include <estuary/maps/builtin_maps.h>

namespace
{
    using Strategies = std::vector<std::unique_ptr<est::Strategy>>;

    struct Turn
    {
        std::size_t step;
        est::Punter punter;
        est::EdgeId edge;

        friend bool operator==(const Turn&, const Turn&) = default;
    };

    template <typename... Ts>
    Strategies make_strategies(std::unique_ptr<Ts>... strategies)
    {
        Strategies res;
        (res.push_back(std::move(strategies)), ...);
        return res;
    }

    /// Keeps returning the same river
    class StubbornStrategy final : public est::Strategy
    {
    public:
        explicit StubbornStrategy(const est::Edge edge): edge_(edge) {}
        std::string_view name() const noexcept override { return "stubborn"; }
        est::StrategyState initialize(const est::Graph&) override { return {}; }
        est::StepResult step(const est::GameState& game) override { return {.edge = edge_, .state = game.strategy_state}; }

    private:
        est::Edge edge_;
    };

    /// Records what it is handed on every turn
    class RecordingStrategy final : public est::Strategy
    {
    public:
        struct Observation
        {
            std::optional<est::Punter> me;
            est::StrategyState state;
        };

        explicit RecordingStrategy(std::vector<Observation>& log): log_(log) {}
        std::string_view name() const noexcept override { return "recording"; }
        est::StrategyState initialize(const est::Graph&) override { return {{"count", "0"}}; }

        est::StepResult step(const est::GameState& game) override
        {
            log_.push_back({game.me, game.strategy_state});
            est::StrategyState state = game.strategy_state;
            state["count"] = std::to_string(std::stoi(state.at("count")) + 1);
            return {.edge = game.graph.unclaimed().front(), .state = std::move(state)};
        }

    private:
        std::vector<Observation>& log_;
    };
} // namespace

TEST(Simulator, TwoPuntersOnAPath)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}});
    const auto strategies =
        make_strategies(std::make_unique<est::LowestEdgeStrategy>(), std::make_unique<est::LowestEdgeStrategy>());
    std::vector<Turn> turns;
    const auto scores = est::simulate(graph, strategies,
        [&](const std::size_t step, const est::Punter punter, const est::Strategy&, const est::Edge& edge)
        { turns.push_back({step, punter, edge.id()}); });
    EXPECT_EQ(turns, (std::vector<Turn>{{0, 0, 0}, {1, 1, 1}}));
    EXPECT_EQ(scores, (std::vector<est::Score>{{.punter = 0, .score = 1}, {.punter = 1, .score = 0}}));
}

TEST(Simulator, NoRiversMeansNoTurns)
{
    const auto graph = est::Graph::create(3, {0}, {});
    const auto strategies =
        make_strategies(std::make_unique<est::LowestEdgeStrategy>(), std::make_unique<est::BruteForceStrategy>(2));
    std::size_t turns = 0;
    const auto scores =
        est::simulate(graph, strategies, [&](std::size_t, est::Punter, const est::Strategy&, const est::Edge&) { turns++; });
    EXPECT_EQ(turns, 0u);
    EXPECT_EQ(scores, (std::vector<est::Score>{{.punter = 0, .score = 0}, {.punter = 1, .score = 0}}));
}

TEST(Simulator, RequiresStrategies)
{
    const auto graph = est::Graph::create(2, {0}, {{0, 1}});
    EXPECT_THROW((void)est::simulate(graph, Strategies{}), std::invalid_argument);
}

TEST(Simulator, SampleMapLowestEdges)
{
    const auto graph = est::Graph::from_map(est::sample_map());
    const auto strategies =
        make_strategies(std::make_unique<est::LowestEdgeStrategy>(), std::make_unique<est::LowestEdgeStrategy>());
    std::size_t turns = 0;
    const auto scores =
        est::simulate(graph, strategies, [&](std::size_t, est::Punter, const est::Strategy&, const est::Edge&) { turns++; });
    EXPECT_EQ(turns, graph.edge_count());
    EXPECT_EQ(scores, (std::vector<est::Score>{{.punter = 0, .score = 12}, {.punter = 1, .score = 9}}));
}

TEST(Simulator, EveryRiverEndsUpClaimedRoundRobin)
{
    const auto graph = est::Graph::from_map(est::grid_map(3, 3, {0, 8}));
    const auto strategies = make_strategies(std::make_unique<est::BruteForceStrategy>(1),
        std::make_unique<est::LowestEdgeStrategy>(), std::make_unique<est::MinimaxStrategy>(2));
    std::vector<bool> seen(graph.edge_count(), false);
    std::size_t turns = 0;
    (void)est::simulate(graph, strategies,
        [&](const std::size_t step, const est::Punter punter, const est::Strategy& strategy, const est::Edge& edge)
        {
            EXPECT_EQ(step, turns++);
            EXPECT_EQ(punter, static_cast<est::Punter>(step % 3));
            EXPECT_EQ(&strategy, strategies[step % 3].get());
            EXPECT_FALSE(seen[edge.id()]);
            seen[edge.id()] = true;
        });
    EXPECT_EQ(turns, graph.edge_count());
    EXPECT_TRUE(std::ranges::all_of(seen, [](const bool b) { return b; }));
}

TEST(Simulator, Deterministic)
{
    const auto graph = est::Graph::from_map(est::sample_map());
    const auto play = [&]
    {
        const auto strategies = make_strategies(std::make_unique<est::BruteForceStrategy>(1),
            std::make_unique<est::BruteForceStrategy>(3), std::make_unique<est::MinimaxStrategy>(3));
        return est::simulate(graph, strategies);
    };
    const auto first = play();
    EXPECT_EQ(first, play());
    std::int64_t total = 0;
    for (const auto& [punter, score] : first)
    {
        EXPECT_GE(score, 0);
        total += score;
    }
    EXPECT_GT(total, 0);
}

TEST(Simulator, ThreadsStrategyState)
{
    const auto graph = est::Graph::from_map(est::ring_map(6, {0}));
    std::vector<RecordingStrategy::Observation> first_log;
    std::vector<RecordingStrategy::Observation> second_log;
    const auto strategies = make_strategies(
        std::make_unique<RecordingStrategy>(first_log), std::make_unique<RecordingStrategy>(second_log));
    (void)est::simulate(graph, strategies);
    ASSERT_EQ(first_log.size(), 3u);
    ASSERT_EQ(second_log.size(), 3u);
    for (std::size_t i = 0; i < 3; i++)
    {
        EXPECT_EQ(first_log[i].me, 0);
        EXPECT_EQ(second_log[i].me, 1);
        EXPECT_EQ(first_log[i].state.at("count"), std::to_string(i));
        EXPECT_EQ(second_log[i].state.at("count"), std::to_string(i));
    }
}

TEST(Simulator, RejectsClaimedRivers)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}});
    const auto strategies = make_strategies(std::make_unique<StubbornStrategy>(graph.edge(0)));
    EXPECT_THROW((void)est::simulate(graph, strategies), est::InvalidMoveError);
}

TEST(Simulator, RejectsForeignRivers)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}});
    auto strategies = make_strategies(std::make_unique<StubbornStrategy>(est::Edge{7, 0, 2}));
    EXPECT_THROW((void)est::simulate(graph, strategies), est::InvalidMoveError);
    strategies = make_strategies(std::make_unique<StubbornStrategy>(est::Edge{1, 0, 2}));
    EXPECT_THROW((void)est::simulate(graph, strategies), est::InvalidMoveError);
}

TEST(Simulator, AnnouncesEachStepBeforeAskingTheStrategy)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}});
    const auto strategies =
        make_strategies(std::make_unique<est::LowestEdgeStrategy>(), std::make_unique<est::LowestEdgeStrategy>());
    std::vector<std::string> events;
    (void)est::simulate(
        graph, strategies,
        [&](const std::size_t step, est::Punter, const est::Strategy&, const est::Edge&)
        { events.push_back(std::format("claimed {}", step)); },
        [&](const std::size_t step, const est::Punter punter, const est::Strategy& strategy)
        {
            EXPECT_EQ(&strategy, strategies[static_cast<std::size_t>(punter)].get());
            events.push_back(std::format("step {}", step));
        });
    EXPECT_EQ(events, (std::vector<std::string>{"step 0", "claimed 0", "step 1", "claimed 1"}));
}

TEST(Simulator, AnnouncesTheStepThatFails)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}});
    const auto strategies = make_strategies(std::make_unique<StubbornStrategy>(est::Edge{7, 0, 2}));
    std::vector<std::size_t> announced;
    std::size_t claims = 0;
    EXPECT_THROW((void)est::simulate(
                     graph, strategies,
                     [&](std::size_t, est::Punter, const est::Strategy&, const est::Edge&) { claims++; },
                     [&](const std::size_t step, est::Punter, const est::Strategy&) { announced.push_back(step); }),
        est::InvalidMoveError);
    EXPECT_EQ(announced, std::vector<std::size_t>{0});
    EXPECT_EQ(claims, 0u);
}

TEST(Simulator, FinalScores)
{
    const auto graph = est::Graph::create(3, {0}, {{0, 1}, {1, 2}}).claim(1, 0).claim(1, 1);
    EXPECT_EQ(est::final_scores(graph, 3),
        (std::vector<est::Score>{{.punter = 0, .score = 0}, {.punter = 1, .score = 5}, {.punter = 2, .score = 0}}));
}
