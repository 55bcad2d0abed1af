#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <certverify/crypto/asymm_key.hpp>
#include <certverify/crypto/asymm_keygen.hpp>
#include <certverify/dtls/msgs/certificate_verify.hpp>
#include <certverify/dtls/transcript_signer.hpp>
#include <certverify/dtls/transcript_verifier.hpp>
#include "test_transcript.hpp"

using namespace certverify;
using namespace certverify::dtls;

TEST(ConcurrencyTest, ParallelSigningUsesDistinctEngines)
{
    auto privateKey = crypto::akey::ec::generate("prime256v1");
    auto publicKey = crypto::AsymmKey::getPublicKey(privateKey);
    auto transcript = test::TestTranscript::threeMessages();
    const SignatureAndHashAlgorithm algorithm(SignatureAndHashAlgorithm::SHA256, SignatureAndHashAlgorithm::ECDSA);

    std::mutex mutex;
    std::set<const crypto::SignatureEngine*> engines;

    crypto::EngineCache<crypto::SignatureEngine> cache([&mutex, &engines](const std::string& name) {
        auto engine = std::make_unique<crypto::SignatureEngine>(name);
        std::lock_guard<std::mutex> lock(mutex);
        engines.insert(engine.get());
        return engine;
    });

    const size_t threadCount = 8;
    const size_t iterations = 16;
    std::atomic<size_t> failures{0};
    std::atomic<size_t> done{0};
    std::vector<std::thread> threads;

    for (size_t i = 0; i < threadCount; ++i)
    {
        threads.emplace_back([&]() {
            TranscriptSigner signer(Settings(), cache);
            TranscriptVerifier verifier(Settings(), cache);
            for (size_t n = 0; n < iterations; ++n)
            {
                std::error_code ec;
                auto signature = signer.sign(privateKey, algorithm, transcript.view(), ec);
                if (ec || !verifier.verify(publicKey, algorithm, signature, transcript.view()))
                {
                    ++failures;
                }
            }
            // Engines die with their thread, keep them until every thread has finished.
            ++done;
            while (done < threadCount)
            {
                std::this_thread::yield();
            }
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0U);
    EXPECT_EQ(engines.size(), threadCount);
}

TEST(ConcurrencyTest, ParallelMessagesWithDefaultCache)
{
    auto transcript = test::TestTranscript::threeMessages();
    const SignatureAndHashAlgorithm algorithms[] = {
        {SignatureAndHashAlgorithm::SHA256, SignatureAndHashAlgorithm::ECDSA},
        {SignatureAndHashAlgorithm::INTRINSIC, SignatureAndHashAlgorithm::ED25519},
        {SignatureAndHashAlgorithm::INTRINSIC, SignatureAndHashAlgorithm::RSA_PSS_RSAE_SHA256},
    };
    auto ecKey = crypto::akey::ec::generate("prime256v1");
    auto edKey = crypto::akey::ed::generate("ED25519");
    auto rsaKey = crypto::akey::rsa::generate(2048);
    Key* keys[] = {ecKey.get(), edKey.get(), rsaKey.get()};

    std::atomic<size_t> failures{0};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < 6; ++i)
    {
        threads.emplace_back([&, i]() {
            const auto index = i % 3;
            for (size_t n = 0; n < 8; ++n)
            {
                auto message = CertificateVerify::sign(algorithms[index], keys[index], transcript.view(), "peer");
                auto decoded = CertificateVerify::deserialize(message.fragmentToByteArray(), "peer");
                if (!decoded.verifySignature(keys[index], transcript.view()))
                {
                    ++failures;
                }
            }
        });
    }

    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0U);
}
