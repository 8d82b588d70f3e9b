#include "estuary/core/traversal.h"

#include <format>
#include <queue>
#include <stdexcept>
#include <clu/parse.h>

#include "estuary/core/errors.h"

namespace est
{
    namespace
    {
        [[noreturn]] void malformed(const std::string_view reason)
        {
            throw std::runtime_error(std::format("Malformed distance encoding: {}", reason));
        }

        std::string_view next_token(std::string_view& text, const char delimiter) noexcept
        {
            const std::size_t pos = text.find(delimiter);
            const std::string_view token = text.substr(0, pos);
            text = pos == std::string_view::npos ? std::string_view{} : text.substr(pos + 1);
            return token;
        }
    } // namespace

    DistanceTable shortest_path(const Graph& graph, const VertexId source)
    {
        DistanceTable distances(graph.vertex_count(), unreachable);
        if (source >= distances.size())
            throw NotFoundError(std::format("Vertex {} is out of range, the graph has {} vertices", //
                source, distances.size()));
        std::queue<VertexId> queue;
        distances[source] = 0;
        queue.push(source);
        while (!queue.empty())
        {
            const VertexId current = queue.front();
            queue.pop();
            const std::size_t next_distance = *distances[current] + 1;
            for (const VertexId next : graph.adjacent(current))
            {
                if (distances[next])
                    continue;
                distances[next] = next_distance;
                queue.push(next);
            }
        }
        return distances;
    }

    DistanceMap shortest_paths(const Graph& graph)
    {
        DistanceMap res;
        for (const VertexId mine : graph.mines())
            res.emplace(mine, shortest_path(graph, mine));
        return res;
    }

    // Format: "<mine>:<d>,<d>,...;<mine>:..." with "-" standing for an unreachable vertex
    std::string encode_distances(const DistanceMap& distances)
    {
        std::string res;
        for (const auto& [mine, table] : distances)
        {
            if (!res.empty())
                res += ';';
            res += std::format("{}:", mine);
            for (std::size_t i = 0; i < table.size(); i++)
            {
                if (i != 0)
                    res += ',';
                if (table[i])
                    res += std::to_string(*table[i]);
                else
                    res += '-';
            }
        }
        return res;
    }

    DistanceMap decode_distances(std::string_view text, const std::size_t vertex_count)
    {
        DistanceMap res;
        while (!text.empty())
        {
            std::string_view entry = next_token(text, ';');
            const auto mine = clu::parse<VertexId>(next_token(entry, ':'));
            if (!mine || *mine >= vertex_count)
                malformed("invalid mine index");
            DistanceTable table;
            table.reserve(vertex_count);
            while (!entry.empty())
            {
                const std::string_view token = next_token(entry, ',');
                if (token == "-")
                {
                    table.emplace_back(unreachable);
                    continue;
                }
                const auto distance = clu::parse<std::size_t>(token);
                if (!distance)
                    malformed(std::format("invalid distance \"{}\"", token));
                table.emplace_back(*distance);
            }
            if (table.size() != vertex_count)
                malformed(std::format("expected {} distances for mine {}, got {}", vertex_count, *mine, table.size()));
            if (!res.emplace(*mine, std::move(table)).second)
                malformed(std::format("mine {} appears twice", *mine));
        }
        return res;
    }
} // namespace est
