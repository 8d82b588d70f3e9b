#pragma once

#include <stdexcept>

#include "macros.h"

ESTUARY_SUPPRESS_EXPORT_WARNING

namespace est
{
    /// \brief Base class of all the errors reported by the library.
    class ESTUARY_API Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// \brief The map description is malformed, e.g. a river references a site that does not exist.
    class ESTUARY_API ConstructionError final : public Error
    {
    public:
        using Error::Error;
    };

    /// \brief No site or river matches the query.
    class ESTUARY_API NotFoundError final : public Error
    {
    public:
        using Error::Error;
    };

    class ESTUARY_API AlreadyClaimedError final : public Error
    {
    public:
        using Error::Error;
    };

    /// \brief A strategy picked an edge that is not in the unclaimed set.
    class ESTUARY_API InvalidMoveError final : public Error
    {
    public:
        using Error::Error;
    };

    /// \brief A claim names a pair of sites that no river joins.
    class ESTUARY_API UnknownEdgeError final : public Error
    {
    public:
        using Error::Error;
    };
} // namespace est

ESTUARY_RESTORE_EXPORT_WARNING
