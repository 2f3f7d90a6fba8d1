// src/core/vector_entry.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "vector.hpp"

// Known knowledge-item fields; anything else goes in extensions.
struct EntryMetadata {
    std::string title;
    std::string content;
    std::string category;
    std::string source_type;
    std::vector<std::string> tags;
    int priority = 0;  // lower is evicted first under the priority strategy
    std::map<std::string, std::string> extensions;
};

/**
 * One cached embedding plus its knowledge metadata.
 *
 * Content fields are fixed once the entry is inside a store. Usage fields
 * (last access, access count) are atomics so concurrent readers can record
 * hits while holding only a shared lock.
 */
class VectorEntry {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    VectorEntry() = default;
    VectorEntry(std::string id, Vector embedding, EntryMetadata metadata = {});

    VectorEntry(const VectorEntry& other);
    VectorEntry& operator=(const VectorEntry& other);

    const std::string& id() const { return id_; }
    const Vector& embedding() const { return embedding_; }
    const EntryMetadata& metadata() const { return metadata_; }
    const std::string& category() const { return metadata_.category; }
    const std::string& sourceType() const { return metadata_.source_type; }
    int priority() const { return metadata_.priority; }

    // Empty until the entry is inserted, unless the repository supplied one.
    const std::string& contentHash() const { return content_hash_; }
    void setContentHash(std::string hash) { content_hash_ = std::move(hash); }

    TimePoint createdAt() const { return created_at_; }
    TimePoint lastAccessedAt() const;
    uint64_t accessCount() const { return access_count_.load(std::memory_order_relaxed); }
    size_t sizeBytes() const { return size_bytes_; }
    // Euclidean norm of the embedding, cached at insert.
    double magnitude() const { return magnitude_; }

    // Repository-supplied usage history (e.g. when rewarming a scope).
    void setCreatedAt(TimePoint t) { created_at_ = t; }
    void setUsage(TimePoint last_accessed, uint64_t access_count);

    // Moves lastAccessedAt forward to `now` (never backwards) and bumps the count.
    void recordAccess(TimePoint now) const;

    std::string computeContentHash() const;
    size_t estimateSizeBytes() const;

private:
    friend class VectorCacheStore;

    static int64_t toNanos(TimePoint t);

    std::string id_;
    Vector embedding_;
    EntryMetadata metadata_;
    std::string content_hash_;
    TimePoint created_at_{};
    size_t size_bytes_{0};
    double magnitude_{0.0};

    mutable std::atomic<int64_t> last_accessed_ns_{0};
    mutable std::atomic<uint64_t> access_count_{0};
};
