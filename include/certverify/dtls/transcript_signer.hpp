/// @file
/// @brief Declaration of the transcript signer.

#pragma once
#include <cstdint>
#include <system_error>
#include <vector>
#include <certverify/crypto/pointers.hpp>
#include <certverify/crypto/engine_cache.hpp>
#include <certverify/crypto/signature_engine.hpp>
#include <certverify/dtls/handshake_message.hpp>
#include <certverify/dtls/settings.hpp>
#include <certverify/dtls/signature_and_hash_algorithm.hpp>

namespace certverify::dtls
{

/// @brief Signs the ordered handshake transcript with the private key of the local certificate.
///
/// The signer keeps no per-call state and may be shared between threads; engines come from the
/// calling thread's slots of the engine cache.
class TranscriptSigner final
{
public:
    explicit TranscriptSigner(const Settings& settings = Settings());

    TranscriptSigner(const Settings& settings, crypto::EngineCache<crypto::SignatureEngine>& engines);

    /// @brief Signs the canonical bytes of every transcript entry in order.
    ///
    /// @param privateKey Private key of the local certificate.
    /// @param algorithm Negotiated signature and hash algorithm.
    /// @param transcript Handshake messages exchanged so far.
    /// @param ec Set to Error::UnknownAlgorithm or Error::SigningFailure on failure.
    ///
    /// @return Signature, empty if @p ec is set.
    std::vector<uint8_t> sign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                              const Transcript& transcript, std::error_code& ec) const;

    /// @brief Signs the canonical bytes of every transcript entry in order.
    ///
    /// @throws Exception with Error::UnknownAlgorithm or Error::SigningFailure.
    std::vector<uint8_t> sign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                              const Transcript& transcript) const;

private:
    void initSign(crypto::SignatureEngine& engine, Key* privateKey) const;

    std::vector<uint8_t> doSign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                                const Transcript& transcript) const;

private:
    Settings settings_;
    crypto::EngineCache<crypto::SignatureEngine>& engines_;
};

} // namespace certverify::dtls
