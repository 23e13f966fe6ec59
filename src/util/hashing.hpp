#ifndef LOCKSTAKE_UTIL_HASHING_HPP
#define LOCKSTAKE_UTIL_HASHING_HPP

#include <cstdint>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 routines used to fingerprint ledger state.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL's libcrypto.
 *
 * DESIGN:
 *   - Sha256Builder feeds fields incrementally with a fixed encoding
 *     (big-endian integers, length-prefixed strings) so equal logical
 *     state always produces the same digest.
 *
 * USAGE:
 *   @code
 *   using namespace lockstake::util::hashing;
 *   Sha256Builder h;
 *   h.addString("alice");
 *   h.addU64(1000);
 *   std::string digest = h.finalizeHex();
 *   @endcode
 */

namespace lockstake {
namespace util {
namespace hashing {

inline std::string toHex(const unsigned char *bytes, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return oss.str();
}

/**
 * @class Sha256Builder
 * @brief Incremental SHA-256 over an EVP context with a canonical field encoding.
 */
class Sha256Builder
{
public:
    Sha256Builder()
        : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free)
        , finalized_(false)
    {
        if (!ctx_) {
            throw std::runtime_error("hashing::Sha256Builder: Failed to create EVP_MD_CTX.");
        }
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestInit_ex failed.");
        }
    }

    Sha256Builder(const Sha256Builder&) = delete;
    Sha256Builder& operator=(const Sha256Builder&) = delete;

    void addBytes(const void *data, size_t len)
    {
        if (finalized_) {
            throw std::runtime_error("hashing::Sha256Builder: already finalized.");
        }
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestUpdate failed.");
        }
    }

    void addU64(uint64_t v)
    {
        unsigned char buf[8];
        for (int i = 7; i >= 0; --i) {
            buf[i] = static_cast<unsigned char>(v & 0xff);
            v >>= 8;
        }
        addBytes(buf, sizeof(buf));
    }

    void addBool(bool b)
    {
        unsigned char c = b ? 1 : 0;
        addBytes(&c, 1);
    }

    // length prefix keeps ("ab","c") distinct from ("a","bc")
    void addString(const std::string &s)
    {
        addU64(s.size());
        addBytes(s.data(), s.size());
    }

    std::string finalizeHex()
    {
        if (finalized_) {
            throw std::runtime_error("hashing::Sha256Builder: already finalized.");
        }
        unsigned char hash[SHA256_DIGEST_LENGTH];
        if (EVP_DigestFinal_ex(ctx_.get(), hash, nullptr) != 1) {
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestFinal_ex failed.");
        }
        finalized_ = true;
        return toHex(hash, SHA256_DIGEST_LENGTH);
    }

private:
    std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX *)> ctx_;
    bool finalized_;
};

} // namespace hashing
} // namespace util
} // namespace lockstake

#endif // LOCKSTAKE_UTIL_HASHING_HPP
