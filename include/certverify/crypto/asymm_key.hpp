#pragma once
#include <string>
#include <string_view>
#include <cstdint>
#include <certverify/crypto/pointers.hpp>
#include <certverify/crypto/secure_array.hpp>
#include <casket/nonstd/span.hpp>

namespace certverify::crypto
{

/// @brief Largest raw private key the library exports (ED448).
inline constexpr size_t MAX_RAW_PRIVATE_KEY_SIZE = 57;

using RawPrivateKey = SecureArray<uint8_t, MAX_RAW_PRIVATE_KEY_SIZE>;

class AsymmKey
{
public:
    static KeyPtr shallowCopy(Key* key);

    static bool isAlgorithm(const Key* key, std::string_view alg);

    static bool isEqual(const Key* a, const Key* b);

    /// @brief Gets the name the key reports for its own algorithm.
    ///
    /// Keys coming from providers other than the default one may report an OID or a vendor alias here.
    static std::string getAlgorithmName(const Key* key);

    /// @brief Exports the raw private key bytes (RFC 8032 seed for EdDSA keys).
    ///
    /// @throws CryptoException if the key has no raw encoding or it exceeds MAX_RAW_PRIVATE_KEY_SIZE.
    static RawPrivateKey getRawPrivateKey(const Key* key);

    /// @brief Builds a key holding only the public half of @p key, round-tripped through SubjectPublicKeyInfo.
    static KeyPtr getPublicKey(Key* key);
};

} // namespace certverify::crypto
