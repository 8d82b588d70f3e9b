#include "estuary/maps/builtin_maps.h"

#include <cmath>
#include <format>
#include <numbers>
#include <stdexcept>

namespace est
{
    MapDescription sample_map()
    {
        // clang-format off
        return {
            .sites = {
                {0, Point{0.0, 0.0}}, {1, Point{1.0, 0.0}}, {2, Point{2.0, 0.0}}, {3, Point{2.0, -1.0}},
                {4, Point{2.0, -2.0}}, {5, Point{1.0, -2.0}}, {6, Point{0.0, -2.0}}, {7, Point{0.0, -1.0}}
            },
            .mines = {1, 5},
            .rivers = {
                {3, 4}, {0, 1}, {2, 3}, {1, 3}, {5, 6}, {4, 5},
                {3, 5}, {6, 7}, {5, 7}, {1, 7}, {0, 7}, {1, 2}
            }
        };
        // clang-format on
    }

    MapDescription grid_map(const std::size_t rows, const std::size_t cols, std::vector<SiteId> mines)
    {
        MapDescription map{.mines = std::move(mines)};
        const auto site_at = [cols](const std::size_t r, const std::size_t c) { return static_cast<SiteId>(r * cols + c); };
        for (std::size_t r = 0; r < rows; r++)
            for (std::size_t c = 0; c < cols; c++)
            {
                map.sites.push_back({site_at(r, c), Point{static_cast<double>(c), static_cast<double>(r)}});
                if (c + 1 < cols)
                    map.rivers.push_back({site_at(r, c), site_at(r, c + 1)});
                if (r + 1 < rows)
                    map.rivers.push_back({site_at(r, c), site_at(r + 1, c)});
            }
        return map;
    }

    MapDescription ring_map(const std::size_t sites, std::vector<SiteId> mines)
    {
        if (sites < 3)
            throw std::invalid_argument(std::format("A ring needs at least 3 sites, got {}", sites));
        MapDescription map{.mines = std::move(mines)};
        for (std::size_t i = 0; i < sites; i++)
        {
            const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(sites);
            map.sites.push_back({static_cast<SiteId>(i), Point{std::cos(angle), std::sin(angle)}});
            map.rivers.push_back({static_cast<SiteId>(i), static_cast<SiteId>((i + 1) % sites)});
        }
        return map;
    }
} // namespace est
