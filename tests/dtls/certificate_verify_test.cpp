#include <gtest/gtest.h>
#include <certverify/crypto/asymm_key.hpp>
#include <certverify/crypto/asymm_keygen.hpp>
#include <certverify/dtls/msgs/certificate_verify.hpp>
#include <certverify/dtls/exception.hpp>
#include "test_transcript.hpp"

using namespace certverify;
using namespace certverify::dtls;

namespace
{

Error DecodeErrorOf(const std::vector<uint8_t>& input)
{
    try
    {
        CertificateVerify::deserialize(input);
    }
    catch (const Exception& e)
    {
        return static_cast<Error>(e.code().value());
    }
    return Error{};
}

} // namespace

TEST(CertificateVerifyTest, Serialize)
{
    const std::vector<uint8_t> signature = {0x30, 0x44, 0x02, 0x20, 0x11};
    CertificateVerify message(SignatureAndHashAlgorithm(4, 3), signature, "peer");

    const std::vector<uint8_t> expected = {0x04, 0x03, 0x00, 0x05, 0x30, 0x44, 0x02, 0x20, 0x11};
    EXPECT_EQ(message.fragmentToByteArray(), expected);
    EXPECT_EQ(message.messageLength(), expected.size());
    EXPECT_EQ(message.type(), HandshakeType::CertificateVerifyCode);
    EXPECT_EQ(message.peer(), "peer");

    std::vector<uint8_t> buffer(16, 0xFF);
    ASSERT_EQ(message.serialize(buffer), expected.size());
    EXPECT_TRUE(std::equal(expected.begin(), expected.end(), buffer.begin()));

    std::vector<uint8_t> small(4);
    ASSERT_THROW(message.serialize(small), std::runtime_error);
}

TEST(CertificateVerifyTest, Deserialize)
{
    const std::vector<uint8_t> input = {0x08, 0x07, 0x00, 0x03, 0xDE, 0xAD, 0xBE};
    auto message = CertificateVerify::deserialize(input, "peer");

    EXPECT_EQ(message.algorithm(), SignatureAndHashAlgorithm(8, 7));
    EXPECT_EQ(message.signature(), std::vector<uint8_t>({0xDE, 0xAD, 0xBE}));
    EXPECT_EQ(message.peer(), "peer");
    EXPECT_EQ(message.fragmentToByteArray(), input);
}

TEST(CertificateVerifyTest, DeserializeUnknownAlgorithm)
{
    const std::vector<uint8_t> input = {0xEE, 0xFF, 0x00, 0x01, 0x00};
    CertificateVerify message(SignatureAndHashAlgorithm(), {});
    ASSERT_NO_THROW(message = CertificateVerify::deserialize(input));
    EXPECT_EQ(message.algorithm(), SignatureAndHashAlgorithm(0xEE, 0xFF));
    EXPECT_FALSE(message.algorithm().isSupported());
}

TEST(CertificateVerifyTest, EmptySignature)
{
    const std::vector<uint8_t> input = {0x04, 0x03, 0x00, 0x00};
    auto message = CertificateVerify::deserialize(input);
    EXPECT_TRUE(message.signature().empty());
    EXPECT_EQ(message.messageLength(), 4U);
}

TEST(CertificateVerifyTest, DeclaredLengthExceedsInput)
{
    std::vector<uint8_t> input = {0x04, 0x03, 0x00, 0x40};
    input.resize(input.size() + 30, 0x5A);
    EXPECT_EQ(DecodeErrorOf(input), Error::DecodeError);
}

TEST(CertificateVerifyTest, TruncatedHeader)
{
    EXPECT_EQ(DecodeErrorOf({}), Error::DecodeError);
    EXPECT_EQ(DecodeErrorOf({0x04}), Error::DecodeError);
    EXPECT_EQ(DecodeErrorOf({0x04, 0x03}), Error::DecodeError);
    EXPECT_EQ(DecodeErrorOf({0x04, 0x03, 0x00}), Error::DecodeError);
}

TEST(CertificateVerifyTest, TrailingBytes)
{
    const std::vector<uint8_t> input = {0x04, 0x03, 0x00, 0x01, 0x00, 0x00};
    EXPECT_EQ(DecodeErrorOf(input), Error::DecodeError);

    utils::DataReader reader("Handshake", input);
    auto message = CertificateVerify::deserialize(reader);
    EXPECT_EQ(message.signature().size(), 1U);
    EXPECT_EQ(reader.remaining_bytes(), 1U);
}

TEST(CertificateVerifyTest, SignatureTooLong)
{
    std::vector<uint8_t> signature(CertificateVerify::MAX_SIGNATURE_SIZE + 1);
    try
    {
        CertificateVerify(SignatureAndHashAlgorithm(4, 3), signature);
        FAIL() << "oversized signature accepted";
    }
    catch (const Exception& e)
    {
        EXPECT_EQ(e.code(), Error::DecodeError);
    }

    signature.pop_back();
    CertificateVerify message(SignatureAndHashAlgorithm(4, 3), signature);
    EXPECT_EQ(message.messageLength(), 4 + CertificateVerify::MAX_SIGNATURE_SIZE);
}

TEST(CertificateVerifyTest, SignAndVerifyRoundTrip)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto publicKey = crypto::AsymmKey::getPublicKey(privateKey);
    auto transcript = test::TestTranscript::threeMessages();

    auto message = CertificateVerify::sign(SignatureAndHashAlgorithm(4, 3), privateKey, transcript.view(), "client");
    EXPECT_EQ(message.peer(), "client");

    auto decoded = CertificateVerify::deserialize(message.fragmentToByteArray(), "client");
    EXPECT_EQ(decoded.algorithm(), message.algorithm());
    EXPECT_EQ(decoded.signature(), message.signature());

    auto result = decoded.verifySignature(publicKey, transcript.view());
    EXPECT_TRUE(result);
    EXPECT_FALSE(result.error());
}

TEST(CertificateVerifyTest, SignUnknownAlgorithm)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto transcript = test::TestTranscript::threeMessages();

    std::error_code ec;
    auto message = CertificateVerify::sign(SignatureAndHashAlgorithm(0xEE, 0xEE), privateKey, transcript.view(),
                                           "client", Settings(), ec);
    EXPECT_FALSE(message.has_value());
    EXPECT_EQ(ec, Error::UnknownAlgorithm);

    ASSERT_THROW(CertificateVerify::sign(SignatureAndHashAlgorithm(1, 1), privateKey, transcript.view()), Exception);
}

TEST(CertificateVerifyTest, VerifyUnknownAlgorithm)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto transcript = test::TestTranscript::threeMessages();

    const std::vector<uint8_t> input = {0xEE, 0xEE, 0x00, 0x02, 0x01, 0x02};
    auto message = CertificateVerify::deserialize(input, "server");

    auto result = message.verifySignature(privateKey, transcript.view());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), Error::AuthenticationFailure);
    EXPECT_EQ(result.alert().peer(), "server");
}

TEST(CertificateVerifyTest, ToString)
{
    CertificateVerify message(SignatureAndHashAlgorithm(8, 7), std::vector<uint8_t>(64));
    EXPECT_EQ(message.toString(), "CertificateVerify: intrinsicwithed25519, signature 64 bytes");
}
