/**
 *  @file       event.hpp
 *
 *  The event value type stored by Chronostore.
 *
 *  Defines the immutable (type, timestamp) pair that is the unit of storage,
 *  together with the ordering used to keep partitions sorted.
 */

#ifndef CHRONOSTORE_CORE_EVENT_HPP_
#define CHRONOSTORE_CORE_EVENT_HPP_

#include "chronostore/core/errors.hpp"
#include "chronostore/core/types.hpp"

#include <compare>
#include <cstddef>
#include <expected>
#include <functional>
#include <utility>

namespace chronostore::core
{

/**
 *  An event with a type label and a timestamp.
 *
 *  Events are immutable once constructed. Construction accepts any
 *  timestamp; the non-negative constraint is enforced when the event is
 *  inserted into a store (see validateForInsert()).
 *
 *  Two events are never considered equal, even when both fields match, so
 *  Event deliberately has no operator==.
 */
class Event
{
  public:
    /**
     *  Constructs an event.
     *
     *  @param      type       Partition label, or kNoType.
     *  @param      timestamp  Event time.
     */
    Event(TypeLabel type, Timestamp timestamp) : type_(std::move(type)), timestamp_(timestamp) {}

    [[nodiscard]] auto type() const noexcept -> const TypeLabel& { return type_; }

    [[nodiscard]] auto timestamp() const noexcept -> Timestamp { return timestamp_; }

    /**
     *  Orders this event relative to another by timestamp only.
     *
     *  Equal timestamps yield `greater`, never `equal`. A binary search
     *  driven by this comparison therefore never stops on an exact match,
     *  and lands on the first of a run of duplicates.
     *
     *  @param      other  The event to compare against.
     *  @return     `less` if this timestamp is smaller, `greater` otherwise.
     */
    [[nodiscard]] constexpr auto compare(const Event& other) const noexcept -> std::strong_ordering
    {
        return timestamp_ < other.timestamp_ ? std::strong_ordering::less
                                             : std::strong_ordering::greater;
    }

    /**
     *  Computes a hash over both the type label and the timestamp.
     */
    [[nodiscard]] auto hash() const noexcept -> std::size_t;

  private:
    TypeLabel type_;
    Timestamp timestamp_;
};

/**
 *  Checks whether an event may be inserted into a store.
 *
 *  @param      event  The candidate event.
 *  @return     Success, or StoreError::kNegativeTimestamp if the event's
 *              timestamp is below zero.
 */
[[nodiscard]] auto validateForInsert(const Event& event) -> std::expected<void, StoreError>;

}  // namespace chronostore::core

template <>
struct std::hash<chronostore::core::Event>
{
    auto operator()(const chronostore::core::Event& event) const noexcept -> std::size_t
    {
        return event.hash();
    }
};

#endif  // CHRONOSTORE_CORE_EVENT_HPP_
