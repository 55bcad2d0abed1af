#pragma once
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <certverify/crypto/pointers.hpp>

namespace certverify::crypto
{

/// @brief Strategies converting private keys whose representation an engine refuses into a standard one.
///
/// Strategies are keyed by the algorithm name the key reports about itself (see AsymmKey::getAlgorithmName),
/// compared case-insensitively. The default set covers EdDSA keys reported under their OIDs or aliases.
class KeyReencoderRegistry final
{
public:
    using Reencoder = std::function<KeyPtr(Key* key)>;

    /// @brief Creates a registry with the EdDSA aliases.
    KeyReencoderRegistry();

    /// @brief Creates a registry without any strategy.
    static KeyReencoderRegistry empty();

    /// @brief Registers a custom strategy for keys reporting @p nativeName.
    void add(std::string_view nativeName, Reencoder reencoder);

    /// @brief Registers raw private key re-encoding into a key of @p standardName.
    void addAlias(std::string_view nativeName, std::string_view standardName);

    bool contains(std::string_view nativeName) const;

    /// @brief Re-encodes @p key with the strategy registered for its native algorithm name.
    ///
    /// @return New key, or nullptr if no strategy is registered for the key's algorithm.
    /// @throws CryptoException if the strategy fails.
    KeyPtr reencode(Key* key) const;

private:
    explicit KeyReencoderRegistry(bool withDefaults);

    std::map<std::string, Reencoder, std::less<>> reencoders_;
};

/// @brief Re-encodes raw private key bytes of @p key as a key of @p standardName.
KeyPtr ReencodeRawPrivateKey(Key* key, std::string_view standardName);

} // namespace certverify::crypto
