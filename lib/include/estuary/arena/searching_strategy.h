#pragma once

#include <optional>
#include <string>

#include "strategy.h"
#include "../evaluation/brute_force_searcher.h"
#include "../evaluation/minimax_searcher.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Parsed form of the distances a searching strategy keeps in its state.
    ///
    /// The text is decoded again only when it differs from the one seen on the previous turn.
    /// A state without cached distances gets them computed from its graph every time.
    class ESTUARY_API EvaluatorCache final
    {
    public:
        [[nodiscard]] const ProjectedScoreEvaluator& get(const GameState& game);

    private:
        std::string encoded_;
        std::size_t vertex_count_ = 0;
        std::optional<ProjectedScoreEvaluator> evaluator_;
        bool from_state_ = false;
    };

    class ESTUARY_API BruteForceStrategy final : public Strategy
    {
    public:
        explicit BruteForceStrategy(int depth);
        [[nodiscard]] std::string_view name() const noexcept override { return name_; }
        [[nodiscard]] StrategyState initialize(const Graph& graph) override;
        [[nodiscard]] StepResult step(const GameState& game) override;
        [[nodiscard]] int depth() const noexcept { return depth_; }

    private:
        int depth_;
        std::string name_;
        BruteForceSearcher searcher_;
        EvaluatorCache evaluator_;
    };

    class ESTUARY_API MinimaxStrategy final : public Strategy
    {
    public:
        explicit MinimaxStrategy(int depth);
        [[nodiscard]] std::string_view name() const noexcept override { return name_; }
        [[nodiscard]] StrategyState initialize(const Graph& graph) override;
        [[nodiscard]] StepResult step(const GameState& game) override;
        [[nodiscard]] int depth() const noexcept { return depth_; }

    private:
        int depth_;
        std::string name_;
        MinimaxSearcher searcher_;
        EvaluatorCache evaluator_;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
