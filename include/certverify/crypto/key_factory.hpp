#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <casket/nonstd/span.hpp>
#include <casket/utils/noncopyable.hpp>
#include <certverify/crypto/pointers.hpp>
#include <certverify/crypto/engine_cache.hpp>

namespace certverify::crypto
{

/// @brief Rebuilds private keys of one algorithm from their raw encoding.
class KeyFactory final : public casket::NonCopyable
{
public:
    explicit KeyFactory(std::string_view algorithm);

    ~KeyFactory() noexcept;

    const std::string& getAlgorithm() const noexcept;

    /// @brief Creates a key pair from raw private key bytes, the public half is derived.
    KeyPtr generatePrivate(nonstd::span<const uint8_t> rawPrivateKey);

    static EngineCache<KeyFactory>& defaultCache();

private:
    std::string algorithm_;
    KeyCtxPtr ctx_;
};

} // namespace certverify::crypto
