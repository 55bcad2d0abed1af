/// @file
/// @brief Declaration of the handshake message base class.

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <casket/nonstd/span.hpp>

namespace certverify::dtls
{

/// @brief Handshake message types (RFC 6347, section 4.3.2).
enum class HandshakeType : uint8_t
{
    HelloRequestCode = 0,
    ClientHelloCode = 1,
    ServerHelloCode = 2,
    HelloVerifyRequestCode = 3,
    NewSessionTicketCode = 4, ///< RFC 5077

    CertificateCode = 11,
    ServerKeyExchangeCode = 12,
    CertificateRequestCode = 13,
    ServerHelloDoneCode = 14,
    CertificateVerifyCode = 15,
    ClientKeyExchangeCode = 16,
    FinishedCode = 20,
};

/// @brief Converts a HandshakeType to a string representation.
/// @param type The HandshakeType to convert.
/// @return The string representation of the HandshakeType.
std::string toString(const HandshakeType type);

/// @brief Size of the DTLS handshake message header.
inline constexpr size_t DTLS_HANDSHAKE_HEADER_SIZE = 12;

/// @brief Base class for handshake messages.
///
/// A handshake message knows how to encode its body; the canonical form used for transcripts
/// is the unfragmented message: header with fragment offset 0 and fragment length equal to the
/// message length, followed by the body.
class HandshakeMessage
{
public:
    explicit HandshakeMessage(std::string peer);

    virtual ~HandshakeMessage() noexcept;

    HandshakeMessage(const HandshakeMessage& other);

    HandshakeMessage(HandshakeMessage&& other) noexcept;

    HandshakeMessage& operator=(const HandshakeMessage& other);

    HandshakeMessage& operator=(HandshakeMessage&& other) noexcept;

    virtual HandshakeType type() const noexcept = 0;

    /// @brief Length of the message body in bytes.
    virtual size_t messageLength() const noexcept = 0;

    /// @brief Encodes the message body.
    virtual std::vector<uint8_t> fragmentToByteArray() const = 0;

    /// @brief Encodes the whole unfragmented message including the handshake header.
    std::vector<uint8_t> toByteArray() const;

    /// @brief Sets the sequence number assigned by the handshake layer.
    void setMessageSeq(uint16_t messageSeq) noexcept;

    uint16_t messageSeq() const noexcept;

    /// @brief Opaque identifier of the peer the message came from or is sent to.
    const std::string& peer() const noexcept;

    virtual std::string toString() const;

private:
    std::string peer_;
    uint16_t messageSeq_;
};

/// @brief Handshake message kept as its raw body, e.g. a message received from the peer.
class GenericHandshakeMessage final : public HandshakeMessage
{
public:
    GenericHandshakeMessage(HandshakeType type, nonstd::span<const uint8_t> body, std::string peer = {});

    HandshakeType type() const noexcept override;

    size_t messageLength() const noexcept override;

    std::vector<uint8_t> fragmentToByteArray() const override;

    /// @brief Parses a single unfragmented handshake message.
    ///
    /// @throws Exception with Error::DecodeError on malformed input or a fragmented message.
    static GenericHandshakeMessage deserialize(nonstd::span<const uint8_t> input, std::string peer = {});

private:
    HandshakeType type_;
    std::vector<uint8_t> body_;
};

/// @brief Ordered list of the handshake messages exchanged so far.
using Transcript = std::vector<const HandshakeMessage*>;

} // namespace certverify::dtls
