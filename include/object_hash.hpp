#pragma once

#include <cstddef>
#include <string>

// =============================================================================
// OBJECT HASH - SHA-1 over the framed object, via OpenSSL EVP
// =============================================================================
// The bytes in front of the nonce value never change between candidates of
// the same width, so they are absorbed once into a prefix context that is
// copied for every candidate.
// =============================================================================

constexpr size_t DIGEST_SIZE = 20;
constexpr size_t DIGEST_HEX_SIZE = DIGEST_SIZE * 2;

struct evp_md_ctx_st;

class ObjectHasher {
public:
    ObjectHasher();
    ~ObjectHasher();

    ObjectHasher(const ObjectHasher&) = delete;
    ObjectHasher& operator=(const ObjectHasher&) = delete;

    bool ok() const { return prefix_ != nullptr && work_ != nullptr; }

    bool setPrefix(const char* data, size_t len);

    // Hash prefix + tail, write DIGEST_HEX_SIZE lowercase hex chars to hexOut
    bool digestHex(const char* tail, size_t len, char* hexOut);

private:
    evp_md_ctx_st* prefix_;
    evp_md_ctx_st* work_;
};

void toHex(const unsigned char* bytes, size_t len, char* out);

// One-shot lowercase hex SHA-1; empty string on failure
std::string sha1Hex(const std::string& data);
