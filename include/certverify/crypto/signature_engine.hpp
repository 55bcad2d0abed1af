#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/noncopyable.hpp>
#include <certverify/crypto/pointers.hpp>
#include <certverify/crypto/engine_cache.hpp>

namespace certverify::crypto
{

/// @brief Stateful signing/verification object bound to a single algorithm such as "SHA256withECDSA".
///
/// The engine must be initialized for signing or verification before data is fed. Algorithms which
/// have no streaming interface (EdDSA) collect the data and process it at once in sign() or verify().
class SignatureEngine : public casket::NonCopyable
{
public:
    /// @brief Static description of a supported algorithm.
    struct Params;

    /// @brief Creates an engine for @p algorithm.
    ///
    /// @throws CryptoException if the name is unknown or the provider does not implement it.
    explicit SignatureEngine(std::string_view algorithm);

    virtual ~SignatureEngine() noexcept;

    const std::string& getAlgorithm() const noexcept;

    /// @brief Key type the engine accepts, e.g. "EC" or "ED25519".
    std::string_view getKeyAlgorithm() const noexcept;

    bool isOneShot() const noexcept;

    /// @throws CryptoException if the key can't be used with this engine.
    virtual void initSign(Key* privateKey);

    /// @throws CryptoException if the key can't be used with this engine.
    virtual void initVerify(Key* publicKey);

    void update(nonstd::span<const uint8_t> message);

    std::vector<uint8_t> sign();

    /// @return true if @p signature matches the data fed since initVerify().
    bool verify(nonstd::span<const uint8_t> signature);

    /// @brief Drops the key reference and any buffered data.
    void reset() noexcept;

    /// @brief Process-wide cache creating engines on demand.
    static EngineCache<SignatureEngine>& defaultCache();

private:
    enum class State
    {
        Idle,
        Signing,
        Verifying
    };

    void checkKey(const Key* key) const;

    void checkState(State expected) const;

private:
    std::string algorithm_;
    const Params* params_;
    HashPtr hash_;
    HashCtxPtr ctx_;
    std::vector<uint8_t> buffer_;
    State state_;
};

} // namespace certverify::crypto
