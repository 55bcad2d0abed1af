#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>

#include <certverify/dtls/handshake_message.hpp>
#include <certverify/utils/data_reader.hpp>
#include <certverify/utils/data_writer.hpp>

namespace certverify::dtls
{

std::string toString(const HandshakeType type)
{
    switch (type)
    {
    case HandshakeType::HelloRequestCode:
        return "HelloRequest";
    case HandshakeType::ClientHelloCode:
        return "ClientHello";
    case HandshakeType::ServerHelloCode:
        return "ServerHello";
    case HandshakeType::HelloVerifyRequestCode:
        return "HelloVerifyRequest";
    case HandshakeType::NewSessionTicketCode:
        return "NewSessionTicket";
    case HandshakeType::CertificateCode:
        return "Certificate";
    case HandshakeType::ServerKeyExchangeCode:
        return "ServerKeyExchange";
    case HandshakeType::CertificateRequestCode:
        return "CertificateRequest";
    case HandshakeType::ServerHelloDoneCode:
        return "ServerHelloDone";
    case HandshakeType::CertificateVerifyCode:
        return "CertificateVerify";
    case HandshakeType::ClientKeyExchangeCode:
        return "ClientKeyExchange";
    case HandshakeType::FinishedCode:
        return "Finished";
    }

    return "Unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

HandshakeMessage::HandshakeMessage(std::string peer)
    : peer_(std::move(peer))
    , messageSeq_(0)
{
}

HandshakeMessage::~HandshakeMessage() noexcept = default;

HandshakeMessage::HandshakeMessage(const HandshakeMessage& other) = default;

HandshakeMessage::HandshakeMessage(HandshakeMessage&& other) noexcept = default;

HandshakeMessage& HandshakeMessage::operator=(const HandshakeMessage& other) = default;

HandshakeMessage& HandshakeMessage::operator=(HandshakeMessage&& other) noexcept = default;

std::vector<uint8_t> HandshakeMessage::toByteArray() const
{
    const auto body = fragmentToByteArray();
    casket::ThrowIfTrue(body.size() > 0xFFFFFF, "handshake message is too long");

    const auto length = static_cast<uint32_t>(body.size());

    utils::DataWriter writer(DTLS_HANDSHAKE_HEADER_SIZE + body.size());
    writer.put_byte(static_cast<uint8_t>(type()));
    writer.put_uint24_t(length);
    writer.put_uint16_t(messageSeq_);
    writer.put_uint24_t(0);
    writer.put_uint24_t(length);
    writer.put_bytes(body);
    return writer.release();
}

void HandshakeMessage::setMessageSeq(uint16_t messageSeq) noexcept
{
    messageSeq_ = messageSeq;
}

uint16_t HandshakeMessage::messageSeq() const noexcept
{
    return messageSeq_;
}

const std::string& HandshakeMessage::peer() const noexcept
{
    return peer_;
}

std::string HandshakeMessage::toString() const
{
    return casket::format("{}: seq {}, length {}", dtls::toString(type()), messageSeq_, messageLength());
}

GenericHandshakeMessage::GenericHandshakeMessage(HandshakeType type, nonstd::span<const uint8_t> body,
                                                 std::string peer)
    : HandshakeMessage(std::move(peer))
    , type_(type)
    , body_(body.begin(), body.end())
{
}

HandshakeType GenericHandshakeMessage::type() const noexcept
{
    return type_;
}

size_t GenericHandshakeMessage::messageLength() const noexcept
{
    return body_.size();
}

std::vector<uint8_t> GenericHandshakeMessage::fragmentToByteArray() const
{
    return body_;
}

GenericHandshakeMessage GenericHandshakeMessage::deserialize(nonstd::span<const uint8_t> input, std::string peer)
{
    utils::DataReader reader("Handshake Message", input);

    const auto type = static_cast<HandshakeType>(reader.get_byte());
    const auto length = reader.get_uint24_t();
    const auto messageSeq = reader.get_uint16_t();
    const auto fragmentOffset = reader.get_uint24_t();
    const auto fragmentLength = reader.get_uint24_t();

    ThrowIfTrue(fragmentOffset != 0 || fragmentLength != length, Error::DecodeError,
                "Invalid Handshake Message: fragmented message");

    GenericHandshakeMessage message(type, reader.get_span_fixed(length), std::move(peer));
    reader.assert_done();

    message.setMessageSeq(messageSeq);
    return message;
}

} // namespace certverify::dtls
