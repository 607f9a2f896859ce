/**
 *  @file       event.cpp
 *
 *  Implementation of event hashing and insert validation.
 */

#include "chronostore/core/event.hpp"

#include "chronostore/core/errors.hpp"
#include "chronostore/core/types.hpp"

#include <cstddef>
#include <expected>
#include <functional>

namespace chronostore::core
{

auto Event::hash() const noexcept -> std::size_t
{
    auto seed = std::hash<TypeLabel>{}(type_);

    // Golden-ratio mix so (a, 1) and (b, 2) do not collide trivially
    constexpr std::size_t kMix = 0x9e3779b97f4a7c15ULL;
    seed ^= std::hash<Timestamp>{}(timestamp_) + kMix + (seed << 6) + (seed >> 2);
    return seed;
}

auto validateForInsert(const Event& event) -> std::expected<void, StoreError>
{
    if (event.timestamp() < 0)
    {
        return std::unexpected(StoreError::kNegativeTimestamp);
    }
    return {};
}

}  // namespace chronostore::core
