/**
 *  @file       event_store.hpp
 *
 *  Thread-safe storage and range querying of timestamped events.
 *
 *  Events are partitioned by type label. Each partition is kept sorted by
 *  timestamp and guarded by its own mutex, so operations on different
 *  types never contend while operations on the same type serialize.
 */

#ifndef CHRONOSTORE_STORAGE_EVENT_STORE_HPP_
#define CHRONOSTORE_STORAGE_EVENT_STORE_HPP_

#include "chronostore/core/errors.hpp"
#include "chronostore/core/event.hpp"
#include "chronostore/core/types.hpp"
#include "chronostore/storage/partition.hpp"
#include "chronostore/storage/range_iterator.hpp"

#include <spdlog/logger.h>

#include <cstddef>
#include <expected>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace chronostore::storage
{

/**
 *  Tuning options for an EventStore.
 */
struct StoreOptions
{
    /**
     *  Default number of event slots reserved in each new partition.
     */
    static constexpr std::size_t kDefaultReservePerType = 0;

    /**
     *  Capacity reserved up front in every newly created partition.
     *
     *  Raising this avoids early reallocations for types that are known to
     *  receive many events.
     */
    std::size_t reserve_per_type{kDefaultReservePerType};
};

/**
 *  In-memory store of events, partitioned by type and sorted by timestamp.
 *
 *  Each partition is a vector kept sorted at all times. This favours
 *  query(), which needs O(log n) to locate a range, over insert() and
 *  RangeIterator::removeCurrent(), which are O(n) because of element
 *  shifting. An ordered tree would make both O(log n) at the cost of
 *  slower range location and more memory per event.
 *
 *  Thread-safety: all member functions may be called concurrently.
 *  The partition map is guarded by a shared mutex that is only held
 *  exclusively while a partition is created or removed. Each partition has
 *  its own mutex, held by insert() for a single insertion and by a
 *  RangeIterator from query() until the iterator is closed.
 *
 *  removeAll() detaches a partition without taking its mutex. An iterator
 *  that is open on that partition keeps exclusive access to the detached
 *  events; removeAll() does not interrupt it.
 */
class EventStore
{
  public:
    /**
     *  Constructs an empty EventStore with default options.
     */
    EventStore();

    /**
     *  Constructs an empty EventStore.
     *
     *  @param      options  Tuning options.
     */
    explicit EventStore(StoreOptions options);

    // Non-copyable, non-movable: iterators refer to partitions it owns
    EventStore(const EventStore&) = delete;
    auto operator=(const EventStore&) -> EventStore& = delete;
    EventStore(EventStore&&) = delete;
    auto operator=(EventStore&&) -> EventStore& = delete;

    ~EventStore() = default;

    /**
     *  Inserts an event into its type's partition, keeping it sorted.
     *
     *  Creates the partition on first use. Blocks while an iterator is open
     *  on the same type.
     *
     *  @param      event  The event to store.
     *  @return     Success, or StoreError::kNegativeTimestamp if the event's
     *              timestamp is below zero (nothing is stored).
     */
    [[nodiscard]] auto insert(core::Event event) -> std::expected<void, core::StoreError>;

    /**
     *  Removes every event of a type, together with its lock.
     *
     *  A type that was never inserted is ignored.
     *
     *  @param      type  The type to drop.
     */
    void removeAll(const core::TypeLabel& type);

    /**
     *  Opens an iterator over the events of a type within [start, end).
     *
     *  Blocks until the type's lock is available. The lock stays held by
     *  the returned iterator until it is closed. Querying a type that holds
     *  no events yields an empty iterator.
     *
     *  @param      type   The type to query.
     *  @param      start  Inclusive lower timestamp bound.
     *  @param      end    Exclusive upper timestamp bound.
     *  @return     An iterator over the matching events, or
     *              StoreError::kInvalidRange if end <= start (no lock is
     *              taken in that case).
     */
    [[nodiscard]] auto query(const core::TypeLabel& type, core::Timestamp start,
                             core::Timestamp end) -> std::expected<RangeIterator, core::StoreError>;

    /**
     *  Returns the number of events stored for a type.
     *
     *  Blocks while an iterator is open on the type.
     *
     *  @param      type  The type to count.
     *  @return     The event count, or 0 if the type has no partition.
     */
    [[nodiscard]] auto count(const core::TypeLabel& type) const -> std::size_t;

    /**
     *  Returns a copy of a type's events in timestamp order.
     *
     *  Blocks while an iterator is open on the type.
     *
     *  @param      type  The type to copy.
     *  @return     The events, or an empty vector if the type has no
     *              partition.
     */
    [[nodiscard]] auto snapshot(const core::TypeLabel& type) const -> std::vector<core::Event>;

    /**
     *  Returns the labels of all types that currently have a partition.
     *
     *  @return     The labels, in unspecified order.
     */
    [[nodiscard]] auto types() const -> std::vector<core::TypeLabel>;

    /**
     *  Returns the number of partitions.
     */
    [[nodiscard]] auto typeCount() const -> std::size_t;

    [[nodiscard]] auto options() const noexcept -> const StoreOptions&;

  private:
    /**
     *  Returns the partition for a type, creating it if absent.
     *
     *  Concurrent first calls for the same type all receive the same
     *  partition.
     */
    auto acquirePartition(const core::TypeLabel& type) -> std::shared_ptr<Partition>;

    /**
     *  Returns the partition for a type, or nullptr if absent.
     */
    [[nodiscard]] auto findPartition(const core::TypeLabel& type) const
        -> std::shared_ptr<Partition>;

    StoreOptions options_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::shared_mutex partitions_mutex_;
    std::unordered_map<core::TypeLabel, std::shared_ptr<Partition>> partitions_;
};

}  // namespace chronostore::storage

#endif  // CHRONOSTORE_STORAGE_EVENT_STORE_HPP_
