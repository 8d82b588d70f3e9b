#include "estuary/utils/report.h"

#include <clu/text/print.h>

namespace est
{
    void print_map_summary(const Graph& graph)
    {
        clu::println("Map: {} sites, {} mines, {} rivers", //
            graph.vertex_count(), graph.mines().size(), graph.edge_count());
    }

    void print_turn(const std::size_t step, const std::string_view name) { clu::println("Step {}: {}", step, name); }

    void print_scores(const std::span<const std::unique_ptr<Strategy>> strategies, const std::span<const Score> scores)
    {
        for (const auto& [punter, score] : scores)
            clu::println("{} {}", strategies[static_cast<std::size_t>(punter)]->name(), score);
    }

    StepCallback step_printer()
    {
        return [](const std::size_t step, Punter, const Strategy& strategy) { print_turn(step, strategy.name()); };
    }
} // namespace est
