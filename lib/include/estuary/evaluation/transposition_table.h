#pragma once

#include <algorithm>
#include <bit>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <vector>
#include <clu/concepts.h>
#include <clu/hash.h>

#include "../core/graph.h"

namespace est
{
    template <clu::arithmetic T>
    struct Bounds final
    {
        static constexpr T inf = []
        {
            if constexpr (std::is_floating_point_v<T>)
                return std::numeric_limits<T>::infinity();
            else
                return std::numeric_limits<T>::max();
        }();

        T lower;
        T upper;

        constexpr Bounds() noexcept: lower(-inf), upper(inf) {}
        constexpr explicit(false) Bounds(const T value) noexcept: lower(value), upper(value) {}
        constexpr Bounds(const T l, const T u) noexcept: lower(l), upper(u) {}

        [[nodiscard]] constexpr bool exact() const noexcept { return lower == upper; }
    };

    /// \brief Owner of every river of a graph, 0 for a free river and punter + 1 otherwise.
    ///
    /// Two move orders that end up with the same claims produce the same key.
    using ClaimKey = std::vector<std::uint32_t>;

    [[nodiscard]] inline ClaimKey claim_key_of(const Graph& graph)
    {
        ClaimKey key;
        for (const Edge& edge : graph.edges())
        {
            const auto owner = graph.owner(edge.id());
            key.push_back(owner ? static_cast<std::uint32_t>(*owner) + 1 : 0);
        }
        return key;
    }

    template <clu::arithmetic T>
    class TranspositionTable final
    {
    public:
        explicit TranspositionTable(const std::size_t table_size = 1 << 16): table_size_(table_size), data_(table_size)
        {
            if (!std::has_single_bit(table_size_))
                throw std::runtime_error("Table size must be a power of two");
        }

        [[nodiscard]] std::size_t hash(const ClaimKey& key) const noexcept
        {
            clu::fnv1a_hasher hasher;
            for (const std::uint32_t owner : key)
                hasher.update(clu::trivial_buffer(owner));
            return hasher.finalize() & (table_size_ - 1);
        }

        void store(const ClaimKey& key, const int depth, const Bounds<T> bounds, const std::size_t hash_hint)
        {
            data_[hash_hint] = {.key = key, .depth = depth, .bounds = bounds, .occupied = true};
        }

        [[nodiscard]] const Bounds<T>* try_load(
            const ClaimKey& key, const int min_depth, const std::size_t hash_hint) const noexcept
        {
            const auto& entry = data_[hash_hint];
            if (!entry.occupied || entry.depth < min_depth || entry.key != key)
                return nullptr;
            return &entry.bounds;
        }

        void clear() noexcept { std::ranges::fill(data_, Entry{}); }

        [[nodiscard]] std::size_t size() const noexcept
        {
            return static_cast<std::size_t>(std::ranges::count(data_, true, &Entry::occupied));
        }

    private:
        struct Entry final
        {
            ClaimKey key;
            int depth = 0;
            Bounds<T> bounds;
            bool occupied = false;
        };

        std::size_t table_size_;
        std::vector<Entry> data_;
    };
} // namespace est
