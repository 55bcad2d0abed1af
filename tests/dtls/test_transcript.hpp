#pragma once
#include <cstdint>
#include <vector>
#include <certverify/dtls/handshake_message.hpp>

namespace certverify::dtls::test
{

/// @brief Owns the messages of a handshake transcript used in tests.
class TestTranscript final
{
public:
    TestTranscript() = default;

    TestTranscript& add(HandshakeType type, std::vector<uint8_t> body)
    {
        messages_.emplace_back(type, body);
        messages_.back().setMessageSeq(static_cast<uint16_t>(messages_.size() - 1));
        return *this;
    }

    /// @brief ClientHello, ServerHello and Certificate with fixed bodies.
    static TestTranscript threeMessages()
    {
        TestTranscript transcript;
        transcript.add(HandshakeType::ClientHelloCode, {0xFE, 0xFD, 0x01, 0x02, 0x03, 0x04})
            .add(HandshakeType::ServerHelloCode, {0xFE, 0xFD, 0x05, 0x06, 0x07, 0x08, 0x09})
            .add(HandshakeType::CertificateCode, {0x00, 0x00, 0x03, 0x30, 0x01, 0x02});
        return transcript;
    }

    std::vector<GenericHandshakeMessage>& messages() noexcept
    {
        return messages_;
    }

    Transcript view() const
    {
        Transcript result;
        for (const auto& message : messages_)
        {
            result.push_back(&message);
        }
        return result;
    }

private:
    std::vector<GenericHandshakeMessage> messages_;
};

} // namespace certverify::dtls::test
