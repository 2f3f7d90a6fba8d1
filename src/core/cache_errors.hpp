// src/core/cache_errors.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

// ========================== CacheError ==========================
// Root of the cache error taxonomy. code() is stable and safe to match on.
class CacheError : public std::runtime_error {
public:
    CacheError(const std::string& code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

class DimensionMismatchError : public CacheError {
public:
    // source is "query" or "insert"
    DimensionMismatchError(size_t expected, size_t actual, const std::string& source)
        : CacheError("DIMENSION_MISMATCH",
                     "Vector dimension mismatch (" + source + "): expected " +
                         std::to_string(expected) + ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual), source_(source) {}

    size_t expected() const { return expected_; }
    size_t actual() const { return actual_; }
    const std::string& vectorSource() const { return source_; }

private:
    size_t expected_;
    size_t actual_;
    std::string source_;
};

class InvalidEntryError : public CacheError {
public:
    explicit InvalidEntryError(const std::string& message)
        : CacheError("INVALID_ENTRY", message) {}
};

class EmbeddingGenerationError : public CacheError {
public:
    explicit EmbeddingGenerationError(const std::string& message)
        : CacheError("EMBEDDING_GENERATION_FAILED", "Embedding generation failed: " + message) {}
};

class CacheInitializationError : public CacheError {
public:
    explicit CacheInitializationError(const std::string& message)
        : CacheError("CACHE_INITIALIZATION_FAILED", message) {}
};

class MemoryManagementError : public CacheError {
public:
    explicit MemoryManagementError(const std::string& message)
        : CacheError("MEMORY_MANAGEMENT_FAILED", message) {}
};

class CacheIntegrityError : public CacheError {
public:
    explicit CacheIntegrityError(const std::string& message)
        : CacheError("CACHE_INTEGRITY_VIOLATION", message) {}
};

class VectorSearchError : public CacheError {
public:
    explicit VectorSearchError(const std::string& message)
        : CacheError("VECTOR_SEARCH_FAILED", "Vector search failed: " + message) {}
};
