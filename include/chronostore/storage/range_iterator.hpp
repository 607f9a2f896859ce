/**
 *  @file       range_iterator.hpp
 *
 *  Cursor over a timestamp range of one partition.
 *
 *  A RangeIterator is handed out by EventStore::query() together with the
 *  partition's lock. It supports forward traversal, reading the current
 *  event and removing it in place, and releases the lock when closed.
 */

#ifndef CHRONOSTORE_STORAGE_RANGE_ITERATOR_HPP_
#define CHRONOSTORE_STORAGE_RANGE_ITERATOR_HPP_

#include "chronostore/core/errors.hpp"
#include "chronostore/core/event.hpp"
#include "chronostore/storage/partition.hpp"
#include "chronostore/storage/range_search.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>

namespace chronostore::storage
{

/**
 *  Forward cursor over the index range [low, high) of a partition.
 *
 *  The iterator owns the lock on its partition for its entire lifetime and
 *  releases it exactly once, either in close() or in the destructor. While
 *  the iterator is open, every other operation on the same partition
 *  blocks.
 *
 *  The lock is a std::mutex, so the iterator must be closed on the thread
 *  that acquired it.
 *
 *  This class is move-only.
 *
 *  Example usage:
 *  @code
 *      auto it = store.query("cpu", 100, 200);
 *      if (!it) {
 *          // Handle error
 *      }
 *      while (it->advance()) {
 *          if (it->current()->timestamp() % 2 == 0) {
 *              (void)it->removeCurrent();
 *          }
 *      }
 *      it->close();  // Or let the destructor handle it
 *  @endcode
 */
class RangeIterator
{
  public:
    /**
     *  Constructs an iterator over a range of a locked partition.
     *
     *  The range is clamped to the partition's current size.
     *
     *  @param      partition  The partition to iterate.
     *  @param      lock       Lock on partition->mutex, already acquired.
     *  @param      range      Index range to iterate.
     */
    RangeIterator(std::shared_ptr<Partition> partition, std::unique_lock<std::mutex> lock,
                  IndexRange range);

    /**
     *  Closes the iterator, releasing the partition lock if still held.
     */
    ~RangeIterator();

    RangeIterator(RangeIterator&& other) noexcept;

    /**
     *  Move assignment operator.
     *
     *  Closes this iterator before taking over the other one's lock.
     */
    auto operator=(RangeIterator&& other) noexcept -> RangeIterator&;

    // Non-copyable
    RangeIterator(const RangeIterator&) = delete;
    auto operator=(const RangeIterator&) -> RangeIterator& = delete;

    /**
     *  Moves the cursor to the next event in range.
     *
     *  The first call positions the cursor on the first event in range.
     *  Once the range is exhausted, further calls keep returning false.
     *
     *  @return     True if the cursor now points at an event.
     */
    auto advance() -> bool;

    /**
     *  Returns the event under the cursor.
     *
     *  @return     A copy of the event, or kNotPositioned if advance() has
     *              not positioned the cursor, or kClosed after close().
     */
    [[nodiscard]] auto current() const -> std::expected<core::Event, core::IteratorError>;

    /**
     *  Removes the event under the cursor from the partition.
     *
     *  The next advance() moves to the event that followed the removed one,
     *  so removing while iterating never skips or repeats events. Until
     *  then the cursor is not positioned.
     *
     *  @return     Success, or kNotPositioned / kClosed as for current().
     */
    [[nodiscard]] auto removeCurrent() -> std::expected<void, core::IteratorError>;

    /**
     *  Releases the partition lock and drops the partition reference.
     *
     *  Calling close() more than once is a no-op.
     */
    void close() noexcept;

    /**
     *  Checks whether close() has been called.
     */
    [[nodiscard]] auto isClosed() const noexcept -> bool;

    /**
     *  Returns the number of in-range events not yet visited.
     */
    [[nodiscard]] auto remaining() const noexcept -> std::size_t;

  private:
    enum class State : std::uint8_t
    {
        kUnstarted,
        kPositioned,
        kAfterRemoval,
        kExhausted,
        kClosed,
    };

    std::shared_ptr<Partition> partition_;
    std::unique_lock<std::mutex> lock_;
    std::size_t end_;
    std::size_t cursor_;
    State state_{State::kUnstarted};
};

}  // namespace chronostore::storage

#endif  // CHRONOSTORE_STORAGE_RANGE_ITERATOR_HPP_
