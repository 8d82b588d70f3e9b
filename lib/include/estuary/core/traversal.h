#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "graph.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Number of rivers on a shortest path, or unreachable.
    using Distance = std::optional<std::size_t>;
    using DistanceTable = std::vector<Distance>;
    using DistanceMap = std::map<VertexId, DistanceTable>;

    inline constexpr std::nullopt_t unreachable = std::nullopt;

    /// \brief Computes the shortest paths from \p source to all the vertices, using only the edges present in \p graph.
    [[nodiscard]] ESTUARY_API DistanceTable shortest_path(const Graph& graph, VertexId source);

    /// \brief Computes the shortest paths from every mine of \p graph.
    [[nodiscard]] ESTUARY_API DistanceMap shortest_paths(const Graph& graph);

    [[nodiscard]] ESTUARY_API std::string encode_distances(const DistanceMap& distances);

    /// \throws std::runtime_error If the text is not a valid encoding for a graph of \p vertex_count vertices.
    [[nodiscard]] ESTUARY_API DistanceMap decode_distances(std::string_view text, std::size_t vertex_count);
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
