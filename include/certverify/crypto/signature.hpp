#pragma once
#include <cstdint>
#include <casket/nonstd/span.hpp>
#include <certverify/crypto/typedefs.hpp>
#include <certverify/crypto/exception.hpp>

namespace certverify::crypto
{

class Signature
{
public:
    static inline void signInit(HashCtx* ctx, const Hash* hash, Key* privateKey, KeyCtx** keyCtx = nullptr)
    {
        ThrowIfFalse(0 < EVP_DigestSignInit(ctx, keyCtx, hash, nullptr, privateKey));
    }

    static inline void signUpdate(HashCtx* ctx, nonstd::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_DigestSignUpdate(ctx, message.data(), message.size()));
    }

    static inline size_t signFinal(HashCtx* ctx, nonstd::span<uint8_t> buffer)
    {
        size_t signatureSize = buffer.size();
        ThrowIfFalse(0 < EVP_DigestSignFinal(ctx, buffer.empty() ? nullptr : buffer.data(), &signatureSize));
        return signatureSize;
    }

    /// @brief One-shot signing, required by algorithms without a streaming interface (EdDSA).
    ///
    /// @return Number of bytes written, or the required buffer size when @p buffer is empty.
    static inline size_t sign(HashCtx* ctx, nonstd::span<uint8_t> buffer, nonstd::span<const uint8_t> tbs)
    {
        size_t signatureSize = buffer.size();
        ThrowIfFalse(0 < EVP_DigestSign(ctx, buffer.empty() ? nullptr : buffer.data(), &signatureSize, tbs.data(),
                                        tbs.size()));
        return signatureSize;
    }

    static inline void verifyInit(HashCtx* ctx, const Hash* hash, Key* publicKey, KeyCtx** keyCtx = nullptr)
    {
        ThrowIfFalse(0 < EVP_DigestVerifyInit(ctx, keyCtx, hash, nullptr, publicKey));
    }

    static inline void verifyUpdate(HashCtx* ctx, nonstd::span<const uint8_t> message)
    {
        ThrowIfFalse(0 < EVP_DigestVerifyUpdate(ctx, message.data(), message.size()));
    }

    /// @return true if the signature matches, false on mismatch or malformed signature.
    static inline bool verifyFinal(HashCtx* ctx, nonstd::span<const uint8_t> signature)
    {
        return 0 < EVP_DigestVerifyFinal(ctx, signature.data(), signature.size());
    }

    /// @return true if the signature matches, false on mismatch or malformed signature.
    static inline bool verify(HashCtx* ctx, nonstd::span<const uint8_t> signature, nonstd::span<const uint8_t> tbs)
    {
        return 0 < EVP_DigestVerify(ctx, signature.data(), signature.size(), tbs.data(), tbs.size());
    }
};

} // namespace certverify::crypto
