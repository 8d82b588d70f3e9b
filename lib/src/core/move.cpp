#include "estuary/core/move.h"

#include <format>

namespace est
{
    namespace
    {
        struct MoveFormatter
        {
            std::string operator()(const Claim& claim) const
            {
                return std::format(R"({{"claim":{{"punter":{},"source":{},"target":{}}}}})", //
                    claim.punter, claim.source, claim.target);
            }

            std::string operator()(const Pass& pass) const
            {
                return std::format(R"({{"pass":{{"punter":{}}}}})", pass.punter);
            }
        };
    } // namespace

    std::string to_string(const Move& move) { return std::visit(MoveFormatter{}, move); }

    std::string to_string(const std::span<const Score> scores)
    {
        std::string res = "[";
        for (std::size_t i = 0; i < scores.size(); i++)
        {
            if (i != 0)
                res += ',';
            res += std::format(R"({{"punter":{},"score":{}}})", scores[i].punter, scores[i].score);
        }
        res += ']';
        return res;
    }
} // namespace est
