/// @file
/// @brief Declaration of the transcript verifier.

#pragma once
#include <cstdint>
#include <string>
#include <system_error>
#include <casket/nonstd/span.hpp>
#include <certverify/crypto/pointers.hpp>
#include <certverify/crypto/engine_cache.hpp>
#include <certverify/crypto/signature_engine.hpp>
#include <certverify/dtls/alert.hpp>
#include <certverify/dtls/handshake_message.hpp>
#include <certverify/dtls/settings.hpp>
#include <certverify/dtls/signature_and_hash_algorithm.hpp>

namespace certverify::dtls
{

/// @brief Outcome of a signature check.
///
/// A failed check carries Error::AuthenticationFailure and the fatal handshake_failure alert which
/// the handshake layer must send before aborting the connection.
class VerifyResult final
{
public:
    static VerifyResult success();

    static VerifyResult failure(std::string peer);

    explicit operator bool() const noexcept
    {
        return !error_;
    }

    std::error_code error() const noexcept
    {
        return error_;
    }

    const Alert& alert() const noexcept
    {
        return alert_;
    }

    /// @throws HandshakeException with the alert if the check failed.
    void throwIfFailed() const;

private:
    VerifyResult(std::error_code ec, Alert alert);

    std::error_code error_;
    Alert alert_;
};

/// @brief Checks a peer signature over the ordered handshake transcript.
class TranscriptVerifier final
{
public:
    explicit TranscriptVerifier(const Settings& settings = Settings());

    TranscriptVerifier(const Settings& settings, crypto::EngineCache<crypto::SignatureEngine>& engines);

    /// @brief Verifies @p signature over the canonical bytes of every transcript entry in order.
    ///
    /// @param publicKey Public key from the peer certificate.
    /// @param algorithm Signature and hash algorithm announced by the peer.
    /// @param signature Signature received from the peer.
    /// @param transcript Handshake messages exchanged before the signature.
    /// @param peer Identifier of the peer, the alert is addressed to it.
    VerifyResult verify(Key* publicKey, const SignatureAndHashAlgorithm& algorithm,
                        nonstd::span<const uint8_t> signature, const Transcript& transcript,
                        const std::string& peer = {}) const;

private:
    bool doVerify(Key* publicKey, const SignatureAndHashAlgorithm& algorithm, nonstd::span<const uint8_t> signature,
                  const Transcript& transcript) const;

private:
    Settings settings_;
    crypto::EngineCache<crypto::SignatureEngine>& engines_;
};

} // namespace certverify::dtls
