/**
 *  @file       types.hpp
 *
 *  Core type definitions for Chronostore.
 *
 *  Defines the fundamental types used throughout Chronostore for
 *  representing event timestamps and the type labels that partition
 *  the store.
 */

#ifndef CHRONOSTORE_CORE_TYPES_HPP_
#define CHRONOSTORE_CORE_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace chronostore::core
{

/**
 *  Type alias for event timestamps.
 *
 *  Signed so that range queries may use negative bounds, but only
 *  non-negative timestamps are accepted into the store.
 */
using Timestamp = std::int64_t;

/**
 *  Label identifying the partition an event belongs to.
 *
 *  An empty optional is the "no type" label. It is a partition of its own,
 *  distinct from the empty string.
 */
using TypeLabel = std::optional<std::string>;

/**
 *  Sentinel label for events that carry no type.
 */
inline const TypeLabel kNoType = std::nullopt;

/**
 *  Converts a TypeLabel to a printable string.
 *
 *  @param      label  The label to convert.
 *  @return     The label text, or "<no type>" for kNoType.
 */
[[nodiscard]] inline auto toString(const TypeLabel& label) -> std::string
{
    if (!label)
    {
        return "<no type>";
    }
    return *label;
}

}  // namespace chronostore::core

#endif  // CHRONOSTORE_CORE_TYPES_HPP_
