/**
 *  @file       range_search.hpp
 *
 *  Binary searches over timestamp-sorted event sequences.
 *
 *  Provides the insertion-point search used to keep partitions sorted and
 *  the boundary search that locates both ends of a timestamp range in one
 *  combined pass.
 */

#ifndef CHRONOSTORE_STORAGE_RANGE_SEARCH_HPP_
#define CHRONOSTORE_STORAGE_RANGE_SEARCH_HPP_

#include "chronostore/core/event.hpp"
#include "chronostore/core/types.hpp"

#include <cstddef>
#include <span>

namespace chronostore::storage
{

/**
 *  Half-open index range [low, high) within a sorted sequence.
 */
struct IndexRange
{
    std::size_t low;
    std::size_t high;

    [[nodiscard]] constexpr auto size() const noexcept -> std::size_t { return high - low; }

    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return low == high; }
};

/**
 *  Finds the index at which an event must be inserted to keep a sequence
 *  sorted.
 *
 *  Uses Event::compare, which never reports equality, so the event is
 *  placed before any existing events with the same timestamp.
 *
 *  @param      events  Sequence sorted ascending by timestamp.
 *  @param      event   The event to be inserted.
 *  @return     Insertion index in [0, events.size()].
 */
[[nodiscard]] auto insertionIndex(std::span<const core::Event> events, const core::Event& event)
    -> std::size_t;

/**
 *  Locates the events whose timestamps fall within [start, end).
 *
 *  The returned range starts at the first event with timestamp >= start
 *  and ends at the first event with timestamp >= end (either bound is
 *  events.size() if no such event exists). Runs of duplicate timestamps
 *  are included or excluded as a whole.
 *
 *  While searching for the low bound, the search also narrows the window
 *  that must contain the high bound, so the second search only covers
 *  what the first one could not rule out.
 *
 *  @param      events  Sequence sorted ascending by timestamp.
 *  @param      start   Inclusive lower timestamp bound.
 *  @param      end     Exclusive upper timestamp bound; must exceed start.
 *  @return     The matching index range.
 */
[[nodiscard]] auto findRange(std::span<const core::Event> events, core::Timestamp start,
                             core::Timestamp end) -> IndexRange;

}  // namespace chronostore::storage

#endif  // CHRONOSTORE_STORAGE_RANGE_SEARCH_HPP_
