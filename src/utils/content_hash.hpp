#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Incremental SHA-256 over length-prefixed fields, rendered as lowercase hex.
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    ContentHasher& addField(const std::string& value);
    ContentHasher& addBytes(const void* data, size_t length);

    std::string hexDigest();

private:
    void update(const void* data, size_t length);

    struct evp_md_ctx_st* ctx_{nullptr};
    bool finished_{false};
};
