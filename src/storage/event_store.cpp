/**
 *  @file       event_store.cpp
 *
 *  Implementation of the partitioned event store.
 */

#include "chronostore/storage/event_store.hpp"

#include "chronostore/core/errors.hpp"
#include "chronostore/core/event.hpp"
#include "chronostore/core/logging.hpp"
#include "chronostore/core/types.hpp"
#include "chronostore/storage/partition.hpp"
#include "chronostore/storage/range_iterator.hpp"
#include "chronostore/storage/range_search.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace chronostore::storage
{

EventStore::EventStore() : EventStore(StoreOptions{}) {}

EventStore::EventStore(StoreOptions options) : options_(options), logger_(core::logger()) {}

auto EventStore::insert(core::Event event) -> std::expected<void, core::StoreError>
{
    auto valid = core::validateForInsert(event);
    if (!valid)
    {
        logger_->debug("rejected insert into '{}' at {}: {}", core::toString(event.type()),
                       event.timestamp(), core::toString(valid.error()));
        return std::unexpected(valid.error());
    }

    auto partition = acquirePartition(event.type());

    std::lock_guard lock(partition->mutex);
    auto& events = partition->events;

    // O(log n) to find the slot, O(n) to shift the tail right
    auto index = insertionIndex(events, event);
    events.insert(std::next(events.begin(), static_cast<std::ptrdiff_t>(index)),
                  std::move(event));

    return {};
}

void EventStore::removeAll(const core::TypeLabel& type)
{
    std::size_t removed = 0;
    {
        // Only the map is synchronized here. Whoever holds the partition's
        // own mutex keeps working on the detached partition.
        std::unique_lock lock(partitions_mutex_);
        removed = partitions_.erase(type);
    }

    if (removed != 0)
    {
        logger_->debug("detached partition '{}'", core::toString(type));
    }
}

auto EventStore::query(const core::TypeLabel& type, core::Timestamp start, core::Timestamp end)
    -> std::expected<RangeIterator, core::StoreError>
{
    if (end <= start)
    {
        logger_->debug("rejected query on '{}' for [{}, {}): {}", core::toString(type), start,
                       end, core::toString(core::StoreError::kInvalidRange));
        return std::unexpected(core::StoreError::kInvalidRange);
    }

    // An unknown type gets an empty partition, so there is always a real
    // mutex to lock
    auto partition = acquirePartition(type);

    // Ownership of this lock moves into the iterator, which releases it
    std::unique_lock lock(partition->mutex);

    auto range = findRange(partition->events, start, end);
    if (logger_->should_log(spdlog::level::trace))
    {
        logger_->trace("query on '{}' for [{}, {}) matched indices [{}, {})",
                       core::toString(type), start, end, range.low, range.high);
    }

    return RangeIterator{std::move(partition), std::move(lock), range};
}

auto EventStore::count(const core::TypeLabel& type) const -> std::size_t
{
    auto partition = findPartition(type);
    if (!partition)
    {
        return 0;
    }

    std::lock_guard lock(partition->mutex);
    return partition->events.size();
}

auto EventStore::snapshot(const core::TypeLabel& type) const -> std::vector<core::Event>
{
    auto partition = findPartition(type);
    if (!partition)
    {
        return {};
    }

    std::lock_guard lock(partition->mutex);
    return partition->events;
}

auto EventStore::types() const -> std::vector<core::TypeLabel>
{
    std::shared_lock lock(partitions_mutex_);

    std::vector<core::TypeLabel> result;
    result.reserve(partitions_.size());
    for (const auto& [label, partition] : partitions_)
    {
        result.push_back(label);
    }

    return result;
}

auto EventStore::typeCount() const -> std::size_t
{
    std::shared_lock lock(partitions_mutex_);
    return partitions_.size();
}

auto EventStore::options() const noexcept -> const StoreOptions&
{
    return options_;
}

auto EventStore::acquirePartition(const core::TypeLabel& type) -> std::shared_ptr<Partition>
{
    // Fast path: the partition usually exists already
    if (auto existing = findPartition(type))
    {
        return existing;
    }

    std::unique_lock lock(partitions_mutex_);

    // Another thread may have created it between the two locks
    auto it = partitions_.find(type);
    if (it != partitions_.end())
    {
        return it->second;
    }

    auto partition = std::make_shared<Partition>();
    partition->events.reserve(options_.reserve_per_type);
    partitions_.emplace(type, partition);
    logger_->debug("created partition '{}'", core::toString(type));

    return partition;
}

auto EventStore::findPartition(const core::TypeLabel& type) const -> std::shared_ptr<Partition>
{
    std::shared_lock lock(partitions_mutex_);

    auto it = partitions_.find(type);
    if (it == partitions_.end())
    {
        return nullptr;
    }
    return it->second;
}

}  // namespace chronostore::storage
