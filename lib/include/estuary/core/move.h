#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <variant>

#include "graph.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Take a river, the ends are given as site ids of the map description.
    struct Claim final
    {
        Punter punter = 0;
        SiteId source = 0;
        SiteId target = 0;

        [[nodiscard]] constexpr friend bool operator==(const Claim&, const Claim&) noexcept = default;
    };

    struct Pass final
    {
        Punter punter = 0;

        [[nodiscard]] constexpr friend bool operator==(const Pass&, const Pass&) noexcept = default;
    };

    using Move = std::variant<Claim, Pass>;

    struct Score final
    {
        Punter punter = 0;
        std::int64_t score = 0;

        [[nodiscard]] constexpr friend bool operator==(const Score&, const Score&) noexcept = default;
    };

    [[nodiscard]] constexpr Punter punter_of(const Move& move) noexcept
    {
        return std::visit([](const auto& m) { return m.punter; }, move);
    }

    /// \brief Single-key wire form, e.g. {"claim":{"punter":0,"source":0,"target":1}} or {"pass":{"punter":0}}.
    [[nodiscard]] ESTUARY_API std::string to_string(const Move& move);
    [[nodiscard]] ESTUARY_API std::string to_string(std::span<const Score> scores);
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
