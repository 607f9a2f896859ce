/**
 *  @file       errors.hpp
 *
 *  Error types for Chronostore.
 *
 *  Defines the error enumerations returned via std::expected by the event
 *  store and its range iterators.
 */

#ifndef CHRONOSTORE_CORE_ERRORS_HPP_
#define CHRONOSTORE_CORE_ERRORS_HPP_

#include <cstdint>
#include <string_view>

namespace chronostore::core
{

/**
 *  Invalid arguments rejected by EventStore operations.
 *
 *  A call that returns one of these errors has no observable side effect:
 *  nothing is inserted, no partition is created and no lock is taken.
 */
enum class StoreError : std::uint8_t
{
    /**
     *  An event with a timestamp below zero was passed to insert().
     */
    kNegativeTimestamp = 1,

    /**
     *  A query was issued with an end time not greater than its start time.
     */
    kInvalidRange = 2,
};

/**
 *  Converts a StoreError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(StoreError error) noexcept -> std::string_view
{
    switch (error)
    {
        case StoreError::kNegativeTimestamp:
            return "timestamp must be non-negative";
        case StoreError::kInvalidRange:
            return "end must exceed start";
    }
    return "unknown store error";
}

/**
 *  Invalid-state conditions reported by RangeIterator.
 */
enum class IteratorError : std::uint8_t
{
    /**
     *  The cursor does not point at an event.
     *
     *  Returned before the first advance(), after advance() has returned
     *  false, and right after removeCurrent().
     */
    kNotPositioned = 1,

    /**
     *  The iterator has been closed and no longer references a partition.
     */
    kClosed = 2,
};

/**
 *  Converts an IteratorError to its human-readable string representation.
 *
 *  @param      error  The error to convert.
 *  @return     A string view describing the error condition.
 */
[[nodiscard]] constexpr auto toString(IteratorError error) noexcept -> std::string_view
{
    switch (error)
    {
        case IteratorError::kNotPositioned:
            return "iterator is not positioned on an event";
        case IteratorError::kClosed:
            return "iterator is closed";
    }
    return "unknown iterator error";
}

}  // namespace chronostore::core

#endif  // CHRONOSTORE_CORE_ERRORS_HPP_
