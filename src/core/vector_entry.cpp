#include "vector_entry.hpp"

#include <utility>

#include "../utils/content_hash.hpp"

VectorEntry::VectorEntry(std::string id, Vector embedding, EntryMetadata metadata)
    : id_(std::move(id)),
      embedding_(std::move(embedding)),
      metadata_(std::move(metadata)) {}

VectorEntry::VectorEntry(const VectorEntry& other)
    : id_(other.id_),
      embedding_(other.embedding_),
      metadata_(other.metadata_),
      content_hash_(other.content_hash_),
      created_at_(other.created_at_),
      size_bytes_(other.size_bytes_),
      magnitude_(other.magnitude_),
      last_accessed_ns_(other.last_accessed_ns_.load(std::memory_order_relaxed)),
      access_count_(other.access_count_.load(std::memory_order_relaxed)) {}

VectorEntry& VectorEntry::operator=(const VectorEntry& other) {
    if (this == &other) return *this;
    id_ = other.id_;
    embedding_ = other.embedding_;
    metadata_ = other.metadata_;
    content_hash_ = other.content_hash_;
    created_at_ = other.created_at_;
    size_bytes_ = other.size_bytes_;
    magnitude_ = other.magnitude_;
    last_accessed_ns_.store(other.last_accessed_ns_.load(std::memory_order_relaxed),
                            std::memory_order_relaxed);
    access_count_.store(other.access_count_.load(std::memory_order_relaxed),
                        std::memory_order_relaxed);
    return *this;
}

int64_t VectorEntry::toNanos(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
}

VectorEntry::TimePoint VectorEntry::lastAccessedAt() const {
    auto ns = std::chrono::nanoseconds(last_accessed_ns_.load(std::memory_order_relaxed));
    return TimePoint(std::chrono::duration_cast<Clock::duration>(ns));
}

void VectorEntry::setUsage(TimePoint last_accessed, uint64_t access_count) {
    last_accessed_ns_.store(toNanos(last_accessed), std::memory_order_relaxed);
    access_count_.store(access_count, std::memory_order_relaxed);
}

void VectorEntry::recordAccess(TimePoint now) const {
    const int64_t now_ns = toNanos(now);
    int64_t seen = last_accessed_ns_.load(std::memory_order_relaxed);
    while (seen < now_ns &&
           !last_accessed_ns_.compare_exchange_weak(seen, now_ns, std::memory_order_relaxed)) {
    }
    access_count_.fetch_add(1, std::memory_order_relaxed);
}

std::string VectorEntry::computeContentHash() const {
    ContentHasher hasher;
    hasher.addField(metadata_.title)
          .addField(metadata_.content)
          .addField(metadata_.category)
          .addField(metadata_.source_type);
    hasher.addField(std::to_string(metadata_.tags.size()));
    for (const auto& tag : metadata_.tags) {
        hasher.addField(tag);
    }
    hasher.addField(std::to_string(metadata_.extensions.size()));
    for (const auto& [key, value] : metadata_.extensions) {
        hasher.addField(key).addField(value);
    }
    hasher.addField(std::to_string(metadata_.priority));
    hasher.addBytes(embedding_.data_ptr(), embedding_.size() * sizeof(float));
    return hasher.hexDigest();
}

size_t VectorEntry::estimateSizeBytes() const {
    size_t bytes = sizeof(VectorEntry);
    bytes += embedding_.size() * sizeof(float);
    bytes += id_.size() + content_hash_.size();
    bytes += metadata_.title.size() + metadata_.content.size();
    bytes += metadata_.category.size() + metadata_.source_type.size();
    for (const auto& tag : metadata_.tags) {
        bytes += tag.size();
    }
    for (const auto& [key, value] : metadata_.extensions) {
        bytes += key.size() + value.size();
    }
    return bytes;
}
