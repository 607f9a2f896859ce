/**
 *  @file       range_iterator.cpp
 *
 *  Implementation of the partition range cursor.
 */

#include "chronostore/storage/range_iterator.hpp"

#include "chronostore/core/errors.hpp"
#include "chronostore/core/event.hpp"
#include "chronostore/storage/partition.hpp"
#include "chronostore/storage/range_search.hpp"

#include <algorithm>
#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <mutex>
#include <utility>

namespace chronostore::storage
{

RangeIterator::RangeIterator(std::shared_ptr<Partition> partition,
                             std::unique_lock<std::mutex> lock, IndexRange range)
    : partition_(std::move(partition)), lock_(std::move(lock))
{
    auto size = partition_ ? partition_->events.size() : std::size_t{0};

    end_ = std::min(range.high, size);
    cursor_ = std::min(range.low, end_);
}

RangeIterator::~RangeIterator()
{
    close();
}

RangeIterator::RangeIterator(RangeIterator&& other) noexcept
    : partition_(std::move(other.partition_)),
      lock_(std::move(other.lock_)),
      end_(other.end_),
      cursor_(other.cursor_),
      state_(other.state_)
{
    // The source no longer owns anything
    other.state_ = State::kClosed;
}

auto RangeIterator::operator=(RangeIterator&& other) noexcept -> RangeIterator&
{
    if (this != &other)
    {
        // Release our own lock before taking ownership of another one
        close();

        partition_ = std::move(other.partition_);
        lock_ = std::move(other.lock_);
        end_ = other.end_;
        cursor_ = other.cursor_;
        state_ = other.state_;

        other.state_ = State::kClosed;
    }
    return *this;
}

auto RangeIterator::advance() -> bool
{
    switch (state_)
    {
        case State::kUnstarted:
        case State::kAfterRemoval:
            // cursor_ already points at the first candidate: either the
            // start of the range, or the element that slid into the slot
            // of the removed one
            break;
        case State::kPositioned:
            ++cursor_;
            break;
        case State::kExhausted:
        case State::kClosed:
            return false;
    }

    if (cursor_ < end_)
    {
        state_ = State::kPositioned;
        return true;
    }

    state_ = State::kExhausted;
    return false;
}

auto RangeIterator::current() const -> std::expected<core::Event, core::IteratorError>
{
    if (state_ == State::kClosed)
    {
        return std::unexpected(core::IteratorError::kClosed);
    }
    if (state_ != State::kPositioned)
    {
        return std::unexpected(core::IteratorError::kNotPositioned);
    }

    return partition_->events[cursor_];
}

auto RangeIterator::removeCurrent() -> std::expected<void, core::IteratorError>
{
    if (state_ == State::kClosed)
    {
        return std::unexpected(core::IteratorError::kClosed);
    }
    if (state_ != State::kPositioned)
    {
        return std::unexpected(core::IteratorError::kNotPositioned);
    }

    // O(n): every later element shifts one slot to the left
    auto& events = partition_->events;
    events.erase(std::next(events.begin(), static_cast<std::ptrdiff_t>(cursor_)));

    // The range shrinks with the sequence; the cursor stays on the slot now
    // holding the successor, which the next advance() will visit
    --end_;
    state_ = State::kAfterRemoval;

    return {};
}

void RangeIterator::close() noexcept
{
    if (state_ == State::kClosed)
    {
        return;
    }

    if (lock_.owns_lock())
    {
        lock_.unlock();
    }

    // Detach from the mutex before the partition that owns it may go away
    lock_ = std::unique_lock<std::mutex>{};
    partition_.reset();
    state_ = State::kClosed;
}

auto RangeIterator::isClosed() const noexcept -> bool
{
    return state_ == State::kClosed;
}

auto RangeIterator::remaining() const noexcept -> std::size_t
{
    switch (state_)
    {
        case State::kUnstarted:
        case State::kAfterRemoval:
            return end_ - cursor_;
        case State::kPositioned:
            return end_ - cursor_ - 1;
        case State::kExhausted:
        case State::kClosed:
            return 0;
    }
    return 0;
}

}  // namespace chronostore::storage
