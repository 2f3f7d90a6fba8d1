#include "content_hash.hpp"

#include <openssl/evp.h>

#include <sstream>
#include <stdexcept>

ContentHasher::ContentHasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
    }
}

ContentHasher::~ContentHasher() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void ContentHasher::update(const void* data, size_t length) {
    if (finished_) {
        throw std::logic_error("ContentHasher already finalized");
    }
    if (length == 0) return;
    if (EVP_DigestUpdate(ctx_, data, length) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

ContentHasher& ContentHasher::addField(const std::string& value) {
    return addBytes(value.data(), value.size());
}

// Length prefix keeps ("ab","c") distinct from ("a","bc"). Always 8 bytes
// little-endian so repository-side hashes match on any host.
ContentHasher& ContentHasher::addBytes(const void* data, size_t length) {
    unsigned char prefix[8];
    uint64_t len = static_cast<uint64_t>(length);
    for (int i = 0; i < 8; ++i) {
        prefix[i] = static_cast<unsigned char>((len >> (8 * i)) & 0xFF);
    }
    update(prefix, sizeof(prefix));
    update(data, length);
    return *this;
}

std::string ContentHasher::hexDigest() {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &md_len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    finished_ = true;

    std::ostringstream oss;
    for (unsigned int i = 0; i < md_len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}
