#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "vector_cache_store.hpp"

// -------------------- ctor / dtor --------------------

VectorCacheStore::VectorCacheStore(const CacheConfig& config)
    : config_(config),
      budget_manager_(std::make_unique<MemoryBudgetManager>(config)),
      dimensions_(config.dimensions),
      time_source_([] { return VectorEntry::Clock::now(); }) {
    config_.validate();
}

VectorCacheStore::~VectorCacheStore() = default;

// -------------------- mutations --------------------

void VectorCacheStore::validateEntry(VectorEntry& entry) const {
    if (entry.id().empty()) {
        throw InvalidEntryError("Entry id must not be empty");
    }
    if (entry.embedding().empty()) {
        throw InvalidEntryError("Entry " + entry.id() + " has a zero-length embedding");
    }
    if (!entry.embedding().is_finite()) {
        throw InvalidEntryError("Entry " + entry.id() + " contains NaN or infinite values");
    }

    if (entry.contentHash().empty()) {
        entry.setContentHash(entry.computeContentHash());
    } else if (config_.integrity_check_enabled && entry.contentHash() != entry.computeContentHash()) {
        throw CacheIntegrityError("Content hash mismatch for entry " + entry.id() +
                                  " (partial write?)");
    }

    entry.magnitude_ = entry.embedding().magnitude();
    entry.size_bytes_ = entry.estimateSizeBytes();
    if (entry.size_bytes_ > config_.maxMemoryBytes()) {
        throw MemoryManagementError("Entry " + entry.id() + " needs " +
                                    std::to_string(entry.size_bytes_) +
                                    " bytes, more than the whole budget of " +
                                    std::to_string(config_.maxMemoryBytes()) + " bytes");
    }
}

EnforcementResult VectorCacheStore::insert(VectorEntry entry) {
    validateEntry(entry);

    std::unique_lock<std::shared_mutex> lock(mutex_);

    const size_t dims = entry.embedding().size();
    if (dimensions_ != 0 && dims != dimensions_) {
        throw DimensionMismatchError(dimensions_, dims, "insert");
    }

    EnforcementResult result;
    result.bytes_before = total_bytes_;
    result.bytes_after = total_bytes_;

    auto existing = index_.find(entry.id());
    EntryPtr previous;
    if (existing != index_.end()) {
        previous = *existing->second;
        if (previous->contentHash() == entry.contentHash()) {
            return result;  // identical content, nothing to do
        }
    }

    const auto now_tp = now();
    if (entry.createdAt() == VectorEntry::TimePoint{}) {
        entry.setCreatedAt(now_tp);
    }
    if (previous) {
        // Replacement keeps the usage history the eviction strategies rank on.
        entry.setUsage(previous->lastAccessedAt(), previous->accessCount());
    } else if (entry.lastAccessedAt() == VectorEntry::TimePoint{}) {
        entry.setUsage(entry.createdAt(), entry.accessCount());
    }

    const std::string id = entry.id();
    auto stored = std::make_shared<VectorEntry>(std::move(entry));
    if (previous) {
        total_bytes_ -= previous->sizeBytes();
        *existing->second = stored;
    } else {
        entries_.push_back(stored);
        index_[id] = std::prev(entries_.end());
    }
    total_bytes_ += stored->sizeBytes();

    const bool established_here = (dimensions_ == 0);
    if (established_here) dimensions_ = dims;

    try {
        result = budget_manager_->enforceLocked(*this, config_.max_memory_kb, &id);
    } catch (const std::exception& ex) {
        restoreLocked(id, previous);
        if (established_here && entries_.empty()) dimensions_ = config_.dimensions;
        std::cerr << "[VectorCache] Insert of " << id << " rejected: " << ex.what() << std::endl;
        throw;
    }
    return result;
}

void VectorCacheStore::restoreLocked(const std::string& id, const EntryPtr& previous) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        // Evicted during its own enforcement; only possible when nothing was pinned.
        if (previous) {
            entries_.push_back(previous);
            index_[id] = std::prev(entries_.end());
            total_bytes_ += previous->sizeBytes();
        }
        return;
    }
    total_bytes_ -= (*it->second)->sizeBytes();
    if (previous) {
        *it->second = previous;
        total_bytes_ += previous->sizeBytes();
    } else {
        entries_.erase(it->second);
        index_.erase(it);
    }
}

bool VectorCacheStore::remove(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return eraseLocked(id);
}

bool VectorCacheStore::eraseLocked(const std::string& id) {
    auto it = index_.find(id);
    if (it == index_.end()) return false;

    total_bytes_ -= (*it->second)->sizeBytes();
    entries_.erase(it->second);
    index_.erase(it);
    return true;
}

void VectorCacheStore::recordEvictionsLocked(size_t count) {
    if (count == 0) return;
    evictions_performed_.fetch_add(count);
    last_eviction_ = now();
}

void VectorCacheStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    index_.clear();
    total_bytes_ = 0;
    dimensions_ = config_.dimensions;
}

// -------------------- queries --------------------

VectorCacheStore::ConstEntryPtr VectorCacheStore::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return *it->second;
}

bool VectorCacheStore::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return index_.count(id) > 0;
}

std::vector<VectorCacheStore::ConstEntryPtr> VectorCacheStore::allEntries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return std::vector<ConstEntryPtr>(entries_.begin(), entries_.end());
}

void VectorCacheStore::forEachEntry(const std::function<void(const ConstEntryPtr&)>& visitor) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        visitor(entry);
    }
}

size_t VectorCacheStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

size_t VectorCacheStore::totalBytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_bytes_;
}

size_t VectorCacheStore::dimensions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return dimensions_;
}

std::optional<VectorEntry::TimePoint> VectorCacheStore::lastEviction() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return last_eviction_;
}

// -------------------- clock --------------------

VectorEntry::TimePoint VectorCacheStore::now() const {
    return time_source_();
}

// Not synchronized: install before the store is shared between threads.
void VectorCacheStore::setTimeSource(TimeSource source) {
    time_source_ = source ? std::move(source) : TimeSource([] { return VectorEntry::Clock::now(); });
}
