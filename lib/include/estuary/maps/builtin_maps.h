#pragma once

#include "../core/graph.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief The 8-site, 12-river sample map with mines on sites 1 and 5.
    [[nodiscard]] ESTUARY_API MapDescription sample_map();

    /// \brief A rows x cols lattice with 4-neighbour rivers, sites are numbered row-major.
    [[nodiscard]] ESTUARY_API MapDescription grid_map(std::size_t rows, std::size_t cols, std::vector<SiteId> mines);

    /// \brief A cycle of \p sites sites, needs at least 3 of them.
    [[nodiscard]] ESTUARY_API MapDescription ring_map(std::size_t sites, std::vector<SiteId> mines);
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
