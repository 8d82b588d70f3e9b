#include "estuary/core/graph.h"

#include <algorithm>
#include <format>
#include <set>
#include <string_view>
#include <unordered_map>

#include "estuary/core/errors.h"

namespace est
{
    struct Graph::Topology final
    {
        std::vector<Vertex> vertices;
        std::vector<VertexId> mines;
        std::vector<Edge> edges; // Indexed by edge id
        std::vector<std::vector<EdgeId>> incidence;
        std::unordered_map<SiteId, VertexId> site_index;
    };

    Graph::Graph(std::shared_ptr<const Topology> topology, std::shared_ptr<const std::vector<EdgeId>> edges,
        std::shared_ptr<const std::vector<bool>> present, std::shared_ptr<const OwnerTable> owners) noexcept:
        topology_(std::move(topology)),
        edges_(std::move(edges)), present_(std::move(present)), owners_(std::move(owners))
    {
    }

    Graph Graph::create(const std::size_t vertex_count, const std::vector<VertexId>& mines, const std::vector<EndPair>& ends)
    {
        std::vector<Vertex> vertices(vertex_count);
        for (VertexId i = 0; i < vertex_count; i++)
            vertices[i] = Vertex{.id = i, .site = static_cast<SiteId>(i)};
        return build(std::move(vertices), mines, ends);
    }

    Graph Graph::from_map(const MapDescription& map)
    {
        std::unordered_map<SiteId, VertexId> index;
        std::vector<Vertex> vertices;
        vertices.reserve(map.sites.size());
        for (const auto& [site, coords] : map.sites)
        {
            const VertexId id = vertices.size();
            if (!index.emplace(site, id).second)
                throw ConstructionError(std::format("Site {} is listed more than once", site));
            vertices.push_back(Vertex{.id = id, .site = site, .coords = coords});
        }

        const auto lookup = [&](const SiteId site, const std::string_view what)
        {
            const auto iter = index.find(site);
            if (iter == index.end())
                throw ConstructionError(std::format("{} references site {} which does not exist", what, site));
            return iter->second;
        };

        std::vector<VertexId> mines;
        mines.reserve(map.mines.size());
        for (const SiteId mine : map.mines)
            mines.push_back(lookup(mine, "Mine list"));
        std::vector<EndPair> ends;
        ends.reserve(map.rivers.size());
        for (const auto& [source, target] : map.rivers)
            ends.emplace_back(lookup(source, "River"), lookup(target, "River"));
        return build(std::move(vertices), std::move(mines), ends);
    }

    Graph Graph::build(std::vector<Vertex> vertices, std::vector<VertexId> mines, const std::vector<EndPair>& ends)
    {
        const std::size_t n = vertices.size();
        auto topology = std::make_shared<Topology>();

        std::ranges::sort(mines);
        mines.erase(std::ranges::unique(mines).begin(), mines.end());
        for (const VertexId mine : mines)
        {
            if (mine >= n)
                throw ConstructionError(std::format("Mine {} is out of range, the map has {} sites", mine, n));
            vertices[mine].is_mine = true;
        }

        topology->incidence.resize(n);
        topology->edges.reserve(ends.size());
        std::set<EndPair> seen;
        for (const auto [a, b] : ends)
        {
            const EdgeId id = topology->edges.size();
            if (a >= n || b >= n)
                throw ConstructionError(std::format( //
                    "River {} ({}, {}) is out of range, the map has {} sites", id, a, b, n));
            if (a == b)
                throw ConstructionError(std::format("River {} connects site {} to itself", id, a));
            const Edge edge{id, a, b};
            if (!seen.insert(edge.ends()).second)
                throw ConstructionError(std::format("River {} duplicates an earlier river ({}, {})", id, a, b));
            topology->edges.push_back(edge);
            topology->incidence[edge.u()].push_back(id);
            topology->incidence[edge.v()].push_back(id);
        }

        for (const auto& vertex : vertices)
            topology->site_index.emplace(vertex.site, vertex.id);
        topology->vertices = std::move(vertices);
        topology->mines = std::move(mines);

        const std::size_t m = topology->edges.size();
        std::vector<EdgeId> all(m);
        for (EdgeId i = 0; i < m; i++)
            all[i] = i;
        return Graph(std::move(topology), //
            std::make_shared<const std::vector<EdgeId>>(std::move(all)),
            std::make_shared<const std::vector<bool>>(m, true), //
            std::make_shared<const OwnerTable>(m));
    }

    std::span<const Vertex> Graph::vertices() const noexcept { return topology().vertices; }

    std::span<const VertexId> Graph::mines() const noexcept { return topology().mines; }

    std::vector<Edge> Graph::edges() const
    {
        std::vector<Edge> res;
        res.reserve(edges_->size());
        for (const EdgeId id : *edges_)
            res.push_back(topology().edges[id]);
        return res;
    }

    const Edge& Graph::edge(const EdgeId id) const
    {
        if (!contains(id))
            throw NotFoundError(std::format("River {} is not part of this graph", id));
        return topology().edges[id];
    }

    bool Graph::contains(const EdgeId id) const noexcept { return id < present_->size() && (*present_)[id]; }

    std::optional<Punter> Graph::owner(const EdgeId id) const noexcept
    {
        if (id >= owners_->size())
            return std::nullopt;
        return (*owners_)[id];
    }

    std::map<EdgeId, Punter> Graph::coloring() const
    {
        std::map<EdgeId, Punter> res;
        for (EdgeId id = 0; id < owners_->size(); id++)
            if (const auto punter = (*owners_)[id])
                res.emplace(id, *punter);
        return res;
    }

    void Graph::check_vertex(const VertexId vertex) const
    {
        if (vertex >= vertex_count())
            throw NotFoundError(std::format("Vertex {} is out of range, the graph has {} vertices", //
                vertex, vertex_count()));
    }

    std::vector<VertexId> Graph::adjacent(const VertexId vertex) const
    {
        check_vertex(vertex);
        std::vector<VertexId> res;
        for (const EdgeId id : topology().incidence[vertex])
            if ((*present_)[id])
                res.push_back(topology().edges[id].opposite(vertex));
        return res;
    }

    std::vector<Edge> Graph::adjacent_edges(const VertexId vertex) const
    {
        check_vertex(vertex);
        std::vector<Edge> res;
        for (const EdgeId id : topology().incidence[vertex])
            if ((*present_)[id])
                res.push_back(topology().edges[id]);
        return res;
    }

    std::vector<Edge> Graph::unclaimed() const
    {
        std::vector<Edge> res;
        for (const EdgeId id : *edges_)
            if (!(*owners_)[id])
                res.push_back(topology().edges[id]);
        return res;
    }

    Graph Graph::claim(const Punter punter, const EdgeId id) const
    {
        if (!contains(id))
            throw NotFoundError(std::format("River {} is not part of this graph", id));
        if (const auto current = (*owners_)[id])
            throw AlreadyClaimedError(std::format("River {} is already claimed by punter {}", id, *current));
        auto owners = std::make_shared<OwnerTable>(*owners_);
        (*owners)[id] = punter;
        return Graph(topology_, edges_, present_, std::move(owners));
    }

    Graph Graph::subgraph(const Punter punter) const
    {
        const std::size_t m = owners_->size();
        auto edges = std::make_shared<std::vector<EdgeId>>();
        auto present = std::make_shared<std::vector<bool>>(m, false);
        auto owners = std::make_shared<OwnerTable>(m);
        for (const EdgeId id : *edges_)
        {
            if ((*owners_)[id] != punter)
                continue;
            edges->push_back(id);
            (*present)[id] = true;
            (*owners)[id] = punter;
        }
        return Graph(topology_, std::move(edges), std::move(present), std::move(owners));
    }

    VertexId Graph::vertex_of(const SiteId site) const
    {
        const auto& index = topology().site_index;
        const auto iter = index.find(site);
        if (iter == index.end())
            throw NotFoundError(std::format("Site {} does not exist", site));
        return iter->second;
    }

    const Edge& Graph::from_original_ends(const SiteId source, const SiteId target) const
    {
        const VertexId a = vertex_of(source);
        const VertexId b = vertex_of(target);
        const EndPair wanted = std::minmax(a, b);
        for (const EdgeId id : topology().incidence[a])
        {
            const Edge& edge = topology().edges[id];
            if ((*present_)[id] && edge.ends() == wanted)
                return edge;
        }
        throw NotFoundError(std::format("No river joins sites {} and {}", source, target));
    }

    std::pair<SiteId, SiteId> Graph::original_ends(const Edge& edge) const
    {
        const auto& edges = topology().edges;
        if (edge.id() >= edges.size() || edges[edge.id()] != edge)
            throw NotFoundError(std::format("River {} ({}, {}) does not belong to this map", //
                edge.id(), edge.u(), edge.v()));
        if (!contains(edge.id()))
            throw NotFoundError(std::format("River {} is not part of this graph", edge.id()));
        const auto& vertices = topology().vertices;
        return {vertices[edge.u()].site, vertices[edge.v()].site};
    }
} // namespace est
