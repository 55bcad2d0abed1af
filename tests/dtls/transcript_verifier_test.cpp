#include <gtest/gtest.h>
#include <certverify/crypto/asymm_key.hpp>
#include <certverify/crypto/asymm_keygen.hpp>
#include <certverify/dtls/transcript_signer.hpp>
#include <certverify/dtls/transcript_verifier.hpp>
#include <certverify/dtls/exception.hpp>
#include "test_transcript.hpp"

using namespace certverify;
using namespace certverify::dtls;
using namespace testing;

struct KeyParams
{
    SignatureAndHashAlgorithm algorithm;
    const char* keyAlgorithm;
};

class TranscriptVerifierTest : public TestWithParam<KeyParams>
{
protected:
    void SetUp() override
    {
        const std::string keyAlgorithm = GetParam().keyAlgorithm;
        if (keyAlgorithm == "EC")
        {
            privateKey_ = crypto::akey::ec::generate("prime256v1");
            otherKey_ = crypto::akey::ec::generate("prime256v1");
        }
        else if (keyAlgorithm == "RSA")
        {
            privateKey_ = crypto::akey::rsa::generate(2048);
            otherKey_ = crypto::akey::rsa::generate(2048);
        }
        else
        {
            privateKey_ = crypto::akey::ed::generate(keyAlgorithm);
            otherKey_ = crypto::akey::ed::generate(keyAlgorithm);
        }
        publicKey_ = crypto::AsymmKey::getPublicKey(privateKey_);
        otherPublicKey_ = crypto::AsymmKey::getPublicKey(otherKey_);
        transcript_ = test::TestTranscript::threeMessages();
        signature_ = signer_.sign(privateKey_, GetParam().algorithm, transcript_.view());
    }

    VerifyResult verify(const Transcript& transcript) const
    {
        return verifier_.verify(publicKey_, GetParam().algorithm, signature_, transcript, "peer");
    }

    crypto::KeyPtr privateKey_;
    crypto::KeyPtr publicKey_;
    crypto::KeyPtr otherKey_;
    crypto::KeyPtr otherPublicKey_;
    test::TestTranscript transcript_;
    std::vector<uint8_t> signature_;
    TranscriptSigner signer_;
    TranscriptVerifier verifier_;
};

TEST_P(TranscriptVerifierTest, GenuineTranscript)
{
    auto result = verify(transcript_.view());
    EXPECT_TRUE(result);
    EXPECT_FALSE(result.alert().isValid());
    ASSERT_NO_THROW(result.throwIfFailed());
}

TEST_P(TranscriptVerifierTest, ModifiedEntry)
{
    auto& body = transcript_.messages()[1];
    auto bytes = body.fragmentToByteArray();
    bytes[2] ^= 0x01;
    transcript_.messages()[1] = GenericHandshakeMessage(body.type(), bytes);
    transcript_.messages()[1].setMessageSeq(1);

    auto result = verify(transcript_.view());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), Error::AuthenticationFailure);
    EXPECT_TRUE(result.alert().isFatal());
    EXPECT_EQ(result.alert().description(), Alert::HandshakeFailure);
    EXPECT_EQ(result.alert().peer(), "peer");
}

TEST_P(TranscriptVerifierTest, ModifiedSequenceNumber)
{
    transcript_.messages()[2].setMessageSeq(7);
    EXPECT_FALSE(verify(transcript_.view()));
}

TEST_P(TranscriptVerifierTest, ReorderedEntries)
{
    auto transcript = transcript_.view();
    std::swap(transcript[0], transcript[1]);
    EXPECT_FALSE(verify(transcript));
}

TEST_P(TranscriptVerifierTest, AddedEntry)
{
    GenericHandshakeMessage extra(HandshakeType::ServerHelloDoneCode, {});
    auto transcript = transcript_.view();
    transcript.push_back(&extra);
    EXPECT_FALSE(verify(transcript));
}

TEST_P(TranscriptVerifierTest, OmittedEntry)
{
    auto transcript = transcript_.view();
    transcript.erase(transcript.begin() + 1);
    EXPECT_FALSE(verify(transcript));
}

TEST_P(TranscriptVerifierTest, WrongPublicKey)
{
    auto result = verifier_.verify(otherPublicKey_, GetParam().algorithm, signature_, transcript_.view(), "peer");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), Error::AuthenticationFailure);
}

TEST_P(TranscriptVerifierTest, CorruptedSignature)
{
    auto signature = signature_;
    signature.back() ^= 0x80;
    EXPECT_FALSE(verifier_.verify(publicKey_, GetParam().algorithm, signature, transcript_.view()));

    signature.clear();
    EXPECT_FALSE(verifier_.verify(publicKey_, GetParam().algorithm, signature, transcript_.view()));
}

TEST_P(TranscriptVerifierTest, FailureThrowsWithAlert)
{
    auto transcript = transcript_.view();
    transcript.pop_back();
    auto result = verify(transcript);
    try
    {
        result.throwIfFailed();
        FAIL() << "no exception";
    }
    catch (const HandshakeException& e)
    {
        EXPECT_EQ(e.code(), Error::AuthenticationFailure);
        EXPECT_EQ(e.alert().description(), Alert::HandshakeFailure);
        EXPECT_TRUE(e.alert().isFatal());
    }
}

INSTANTIATE_TEST_CASE_P(
    Algorithms, TranscriptVerifierTest,
    Values(KeyParams{{SignatureAndHashAlgorithm::SHA256, SignatureAndHashAlgorithm::ECDSA}, "EC"},
           KeyParams{{SignatureAndHashAlgorithm::SHA384, SignatureAndHashAlgorithm::ECDSA}, "EC"},
           KeyParams{{SignatureAndHashAlgorithm::SHA256, SignatureAndHashAlgorithm::RSA}, "RSA"},
           KeyParams{{SignatureAndHashAlgorithm::INTRINSIC, SignatureAndHashAlgorithm::RSA_PSS_RSAE_SHA256}, "RSA"},
           KeyParams{{SignatureAndHashAlgorithm::INTRINSIC, SignatureAndHashAlgorithm::ED25519}, "ED25519"},
           KeyParams{{SignatureAndHashAlgorithm::INTRINSIC, SignatureAndHashAlgorithm::ED448}, "ED448"}));

TEST(TranscriptVerifierScenarioTest, EmptyTranscript)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto publicKey = crypto::AsymmKey::getPublicKey(privateKey);
    const SignatureAndHashAlgorithm algorithm(4, 3);

    TranscriptSigner signer;
    TranscriptVerifier verifier;

    auto signature = signer.sign(privateKey, algorithm, Transcript{});
    ASSERT_FALSE(signature.empty());
    EXPECT_TRUE(verifier.verify(publicKey, algorithm, signature, Transcript{}));

    auto transcript = test::TestTranscript::threeMessages();
    auto result = verifier.verify(publicKey, algorithm, signature, transcript.view());
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), Error::AuthenticationFailure);
}

TEST(TranscriptVerifierScenarioTest, AlgorithmMismatch)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto publicKey = crypto::AsymmKey::getPublicKey(privateKey);
    auto transcript = test::TestTranscript::threeMessages();

    TranscriptSigner signer;
    TranscriptVerifier verifier;

    auto signature = signer.sign(privateKey, SignatureAndHashAlgorithm(4, 3), transcript.view());
    EXPECT_FALSE(verifier.verify(publicKey, SignatureAndHashAlgorithm(5, 3), signature, transcript.view()));
    EXPECT_FALSE(verifier.verify(publicKey, SignatureAndHashAlgorithm(4, 1), signature, transcript.view()));
    EXPECT_FALSE(verifier.verify(publicKey, SignatureAndHashAlgorithm(1, 3), signature, transcript.view()));
}

TEST(TranscriptVerifierScenarioTest, NullKey)
{
    auto transcript = test::TestTranscript::threeMessages();
    TranscriptVerifier verifier;
    std::vector<uint8_t> signature(64, 0x01);
    auto result = verifier.verify(nullptr, SignatureAndHashAlgorithm(8, 7), signature, transcript.view(), "peer");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.alert().peer(), "peer");
}

TEST(TranscriptVerifierScenarioTest, OversizedTranscriptEntry)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto publicKey = crypto::AsymmKey::getPublicKey(privateKey);
    const SignatureAndHashAlgorithm algorithm(4, 3);

    auto transcript = test::TestTranscript::threeMessages();
    auto signature = TranscriptSigner().sign(privateKey, algorithm, transcript.view());
    transcript.add(HandshakeType::CertificateCode, std::vector<uint8_t>(0x1000000, 0x30));

    auto result = TranscriptVerifier().verify(publicKey, algorithm, signature, transcript.view(), "peer");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error(), Error::AuthenticationFailure);
    EXPECT_EQ(result.alert().peer(), "peer");
}
