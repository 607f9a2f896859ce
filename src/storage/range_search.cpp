/**
 *  @file       range_search.cpp
 *
 *  Implementation of the insertion-point and boundary searches.
 */

#include "chronostore/storage/range_search.hpp"

#include "chronostore/core/event.hpp"
#include "chronostore/core/types.hpp"

#include <algorithm>
#include <compare>
#include <cstddef>
#include <span>

namespace chronostore::storage
{

auto insertionIndex(std::span<const core::Event> events, const core::Event& event) -> std::size_t
{
    // Everything that compares `less` than the new event stays in front of it.
    // Ties compare `greater`, so the partition point sits before duplicates.
    auto insertion_point = std::ranges::partition_point(events,
                                                        [&event](const core::Event& existing)
                                                        {
                                                            return existing.compare(event) < 0;
                                                        });

    return static_cast<std::size_t>(insertion_point - events.begin());
}

auto findRange(std::span<const core::Event> events, core::Timestamp start, core::Timestamp end)
    -> IndexRange
{
    // Both searches work on half-open windows [low, high). The answer for
    // the end bound is known to lie in [next_low, next_high].
    std::size_t low = 0;
    std::size_t high = events.size();
    std::size_t next_low = 0;
    std::size_t next_high = events.size();

    while (low < high)
    {
        auto mid = low + ((high - low) / 2);
        auto mid_val = events[mid].timestamp();

        if (start <= mid_val)
        {
            high = mid;
            if (end <= mid_val)
            {
                // The end bound cannot be past this element either
                next_high = mid;
            }
        }
        else
        {
            low = mid + 1;
            if (end > mid_val)
            {
                next_low = low;
            }
        }
        // No early exit on an exact match: with duplicates we need the first
        // position, not just any position holding the value.
    }

    IndexRange range{.low = low, .high = 0};

    // The end bound never precedes the start bound
    next_low = std::max(next_low, low);

    while (next_low < next_high)
    {
        auto mid = next_low + ((next_high - next_low) / 2);
        auto mid_val = events[mid].timestamp();

        if (end <= mid_val)
        {
            next_high = mid;
        }
        else
        {
            next_low = mid + 1;
        }
    }
    range.high = next_low;

    return range;
}

}  // namespace chronostore::storage
