/**
 *  @file       partition.hpp
 *
 *  Per-type storage unit of the event store.
 */

#ifndef CHRONOSTORE_STORAGE_PARTITION_HPP_
#define CHRONOSTORE_STORAGE_PARTITION_HPP_

#include "chronostore/core/event.hpp"

#include <mutex>
#include <vector>

namespace chronostore::storage
{

/**
 *  The events of one type together with the mutex guarding them.
 *
 *  `events` is sorted ascending by timestamp whenever `mutex` is not held.
 *  Partitions are shared-owned: an iterator keeps its partition alive even
 *  after EventStore::removeAll() has detached it from the store.
 */
struct Partition
{
    std::mutex mutex;
    std::vector<core::Event> events;
};

}  // namespace chronostore::storage

#endif  // CHRONOSTORE_STORAGE_PARTITION_HPP_
