#pragma once

#include <cassert>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "macros.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    using VertexId = std::size_t; ///< Dense internal index of a site, 0..n-1
    using EdgeId = std::size_t; ///< Dense index of a river in the map's river list
    using SiteId = std::int64_t; ///< Site identifier as given by the map description
    using Punter = int;

    struct Point final
    {
        double x = 0.0;
        double y = 0.0;

        [[nodiscard]] constexpr friend bool operator==(Point, Point) noexcept = default;
    };

    struct Vertex final
    {
        VertexId id = 0;
        SiteId site = 0;
        bool is_mine = false;
        std::optional<Point> coords; ///< Presentation only

        [[nodiscard]] friend bool operator==(const Vertex&, const Vertex&) noexcept = default;
    };

    /// \brief A river. The two ends are always stored with the lower vertex index first.
    class Edge final
    {
    public:
        constexpr Edge(const EdgeId id, const VertexId a, const VertexId b) noexcept:
            id_(id), u_(a < b ? a : b), v_(a < b ? b : a)
        {
            assert(u_ <= v_);
        }

        [[nodiscard]] constexpr EdgeId id() const noexcept { return id_; }
        [[nodiscard]] constexpr VertexId u() const noexcept { return u_; }
        [[nodiscard]] constexpr VertexId v() const noexcept { return v_; }
        [[nodiscard]] constexpr std::pair<VertexId, VertexId> ends() const noexcept { return {u_, v_}; }
        [[nodiscard]] constexpr bool contains(const VertexId w) const noexcept { return w == u_ || w == v_; }

        /// \brief Get the other end of this edge.
        /// \param w One of the ends of this edge.
        [[nodiscard]] constexpr VertexId opposite(const VertexId w) const noexcept
        {
            assert(contains(w));
            return w == u_ ? v_ : u_;
        }

        [[nodiscard]] constexpr friend bool operator==(const Edge&, const Edge&) noexcept = default;

    private:
        EdgeId id_;
        VertexId u_;
        VertexId v_;
    };

    struct Site final
    {
        SiteId id = 0;
        std::optional<Point> coords;
    };

    struct River final
    {
        SiteId source = 0;
        SiteId target = 0;
    };

    /// \brief A map as received from the outside world, sites may be numbered sparsely.
    struct MapDescription final
    {
        std::vector<Site> sites;
        std::vector<SiteId> mines;
        std::vector<River> rivers;
    };

    /// \brief An immutable snapshot of the game graph together with its claim coloring.
    ///
    /// Claiming a river or filtering by owner produces a new snapshot. All snapshots derived
    /// from the same map share the topology, each one owns its presence list and ownership table.
    class ESTUARY_API Graph final
    {
    public:
        using EndPair = std::pair<VertexId, VertexId>;

        /// \brief Build a graph whose site ids are the dense indices 0..vertex_count-1.
        /// \throws ConstructionError If a mine or a river references a vertex that does not exist.
        [[nodiscard]] static Graph create(
            std::size_t vertex_count, const std::vector<VertexId>& mines, const std::vector<EndPair>& ends);

        /// \brief Build a graph from a map description, remapping site ids to dense indices in site order.
        /// \throws ConstructionError If the description is malformed.
        [[nodiscard]] static Graph from_map(const MapDescription& map);

        [[nodiscard]] std::span<const Vertex> vertices() const noexcept;
        [[nodiscard]] std::span<const VertexId> mines() const noexcept;
        [[nodiscard]] std::size_t vertex_count() const noexcept { return vertices().size(); }
        [[nodiscard]] std::size_t edge_count() const noexcept { return edges_->size(); }

        /// \brief Edges present in this snapshot, in id order.
        [[nodiscard]] std::vector<Edge> edges() const;
        [[nodiscard]] const Edge& edge(EdgeId id) const;
        [[nodiscard]] bool contains(EdgeId id) const noexcept;
        [[nodiscard]] std::optional<Punter> owner(EdgeId id) const noexcept;
        [[nodiscard]] bool is_claimed(const Edge& edge) const noexcept { return owner(edge.id()).has_value(); }
        [[nodiscard]] bool is_claimed_by(const Punter punter, const Edge& edge) const noexcept
        {
            return owner(edge.id()) == punter;
        }
        [[nodiscard]] std::map<EdgeId, Punter> coloring() const;

        [[nodiscard]] std::vector<VertexId> adjacent(VertexId vertex) const;
        [[nodiscard]] std::vector<Edge> adjacent_edges(VertexId vertex) const;
        [[nodiscard]] std::vector<Edge> unclaimed() const;

        /// \throws NotFoundError If the edge is not part of this snapshot.
        /// \throws AlreadyClaimedError If the edge already has an owner.
        [[nodiscard]] Graph claim(Punter punter, EdgeId id) const;

        /// \brief Focus on the edges owned by one punter, vertices and mines are kept.
        [[nodiscard]] Graph subgraph(Punter punter) const;

        [[nodiscard]] VertexId vertex_of(SiteId site) const;
        [[nodiscard]] const Edge& from_original_ends(SiteId source, SiteId target) const;
        [[nodiscard]] std::pair<SiteId, SiteId> original_ends(const Edge& edge) const;

    private:
        struct Topology;
        using OwnerTable = std::vector<std::optional<Punter>>;

        std::shared_ptr<const Topology> topology_;
        std::shared_ptr<const std::vector<EdgeId>> edges_;
        std::shared_ptr<const std::vector<bool>> present_;
        std::shared_ptr<const OwnerTable> owners_;

        Graph(std::shared_ptr<const Topology> topology, std::shared_ptr<const std::vector<EdgeId>> edges,
            std::shared_ptr<const std::vector<bool>> present, std::shared_ptr<const OwnerTable> owners) noexcept;

        [[nodiscard]] static Graph build(
            std::vector<Vertex> vertices, std::vector<VertexId> mines, const std::vector<EndPair>& ends);
        [[nodiscard]] const Topology& topology() const noexcept { return *topology_; }
        void check_vertex(VertexId vertex) const;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
