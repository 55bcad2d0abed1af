/// @file
/// @brief Declaration of the CertificateVerify handshake message.

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <certverify/crypto/typedefs.hpp>
#include <certverify/dtls/handshake_message.hpp>
#include <certverify/dtls/settings.hpp>
#include <certverify/dtls/signature_and_hash_algorithm.hpp>
#include <certverify/dtls/transcript_verifier.hpp>
#include <certverify/utils/data_reader.hpp>

namespace certverify::dtls
{

/// @brief CertificateVerify message (RFC 5246, section 7.4.8).
///
/// Proves that the sender owns the private key of the certificate it presented by signing all
/// handshake messages exchanged up to this one. The message is immutable once built.
///
/// @code
/// struct {
///     SignatureAndHashAlgorithm algorithm;
///     opaque signature<0..2^16-1>;
/// } CertificateVerify;
/// @endcode
class CertificateVerify final : public HandshakeMessage
{
public:
    /// @brief Maximum signature size the length field can express.
    static constexpr size_t MAX_SIGNATURE_SIZE = 0xFFFF;

    /// @brief Builds the message from received parts, the signature is copied as is.
    ///
    /// @throws Exception with Error::DecodeError if the signature is longer than MAX_SIGNATURE_SIZE.
    CertificateVerify(const SignatureAndHashAlgorithm& algorithm, nonstd::span<const uint8_t> signature,
                      std::string peer = {});

    /// @brief Signs @p transcript and builds the message around the signature.
    ///
    /// @throws Exception with Error::UnknownAlgorithm or Error::SigningFailure.
    static CertificateVerify sign(const SignatureAndHashAlgorithm& algorithm, Key* privateKey,
                                  const Transcript& transcript, std::string peer = {},
                                  const Settings& settings = Settings());

    /// @brief Signs @p transcript and builds the message around the signature.
    ///
    /// @return The message, or std::nullopt with @p ec set.
    static std::optional<CertificateVerify> sign(const SignatureAndHashAlgorithm& algorithm, Key* privateKey,
                                                 const Transcript& transcript, std::string peer,
                                                 const Settings& settings, std::error_code& ec);

    /// @brief Reads the message body from @p reader.
    ///
    /// Algorithm codes are taken as they are, unknown pairs are rejected only when the signature is checked.
    ///
    /// @throws Exception with Error::DecodeError if the header or the declared signature is cut short.
    static CertificateVerify deserialize(utils::DataReader& reader, std::string peer = {});

    /// @brief Parses the message body occupying exactly @p input.
    ///
    /// @throws Exception with Error::DecodeError if the input is cut short or has trailing bytes.
    static CertificateVerify deserialize(nonstd::span<const uint8_t> input, std::string peer = {});

    HandshakeType type() const noexcept override;

    /// @brief Body length: algorithm (2 bytes), signature length (2 bytes) and signature.
    size_t messageLength() const noexcept override;

    std::vector<uint8_t> fragmentToByteArray() const override;

    /// @brief Writes the body into @p output.
    ///
    /// @return Number of bytes written.
    size_t serialize(nonstd::span<uint8_t> output) const;

    /// @brief Checks the signature against the peer public key and the transcript preceding this message.
    VerifyResult verifySignature(Key* publicKey, const Transcript& transcript,
                                 const Settings& settings = Settings()) const;

    const SignatureAndHashAlgorithm& algorithm() const noexcept;

    const std::vector<uint8_t>& signature() const noexcept;

    std::string toString() const override;

private:
    SignatureAndHashAlgorithm algorithm_;
    std::vector<uint8_t> signature_;
};

} // namespace certverify::dtls
