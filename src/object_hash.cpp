#include "object_hash.hpp"
#include <openssl/evp.h>

ObjectHasher::ObjectHasher()
    : prefix_(EVP_MD_CTX_new()), work_(EVP_MD_CTX_new())
{
}

ObjectHasher::~ObjectHasher()
{
    EVP_MD_CTX_free(work_);
    EVP_MD_CTX_free(prefix_);
}

bool ObjectHasher::setPrefix(const char* data, size_t len)
{
    if (!ok()) return false;
    if (EVP_DigestInit_ex(prefix_, EVP_sha1(), nullptr) != 1) return false;
    return EVP_DigestUpdate(prefix_, data, len) == 1;
}

bool ObjectHasher::digestHex(const char* tail, size_t len, char* hexOut)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (EVP_MD_CTX_copy_ex(work_, prefix_) != 1) return false;
    if (EVP_DigestUpdate(work_, tail, len) != 1) return false;
    if (EVP_DigestFinal_ex(work_, digest, &digestLen) != 1) return false;
    if (digestLen != DIGEST_SIZE) return false;

    toHex(digest, digestLen, hexOut);
    return true;
}

void toHex(const unsigned char* bytes, size_t len, char* out)
{
    static const char HEX[] = "0123456789abcdef";
    for (size_t i = 0; i < len; ++i) {
        out[i * 2 + 0] = HEX[bytes[i] >> 4];
        out[i * 2 + 1] = HEX[bytes[i] & 0xf];
    }
}

std::string sha1Hex(const std::string& data)
{
    ObjectHasher hasher;
    char hex[DIGEST_HEX_SIZE];
    if (!hasher.setPrefix(data.data(), data.size())) return std::string();
    if (!hasher.digestHex(nullptr, 0, hex)) return std::string();
    return std::string(hex, DIGEST_HEX_SIZE);
}
