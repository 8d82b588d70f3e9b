#pragma once

#include <memory>
#include <span>
#include <string_view>

#include "../arena/simulator.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    ESTUARY_API void print_map_summary(const Graph& graph);
    ESTUARY_API void print_turn(std::size_t step, std::string_view name);
    ESTUARY_API void print_scores(std::span<const std::unique_ptr<Strategy>> strategies, std::span<const Score> scores);

    /// \brief Prints "Step <n>: <strategy-name>" before every strategy is asked for its river.
    [[nodiscard]] ESTUARY_API StepCallback step_printer();
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
