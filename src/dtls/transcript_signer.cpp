#include <stdexcept>
#include <casket/log/log_manager.hpp>
#include <casket/utils/format.hpp>

#include <certverify/dtls/transcript_signer.hpp>
#include <certverify/dtls/algorithm_registry.hpp>
#include <certverify/dtls/exception.hpp>
#include <certverify/crypto/exception.hpp>
#include <certverify/crypto/asymm_key.hpp>
#include <certverify/utils/finally.hpp>

namespace certverify::dtls
{

TranscriptSigner::TranscriptSigner(const Settings& settings)
    : TranscriptSigner(settings, crypto::SignatureEngine::defaultCache())
{
}

TranscriptSigner::TranscriptSigner(const Settings& settings, crypto::EngineCache<crypto::SignatureEngine>& engines)
    : settings_(settings)
    , engines_(engines)
{
}

std::vector<uint8_t> TranscriptSigner::sign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                                            const Transcript& transcript, std::error_code& ec) const
{
    ec.clear();
    try
    {
        return doSign(privateKey, algorithm, transcript);
    }
    catch (const Exception& e)
    {
        casket::error("Failed to sign handshake transcript with {}: {}", algorithm.toString(), e.what());
        ec = e.code();
    }
    catch (const crypto::CryptoException& e)
    {
        casket::error("Failed to sign handshake transcript with {}: {}", algorithm.toString(), e.what());
        ec = MakeErrorCode(Error::SigningFailure);
    }
    catch (const std::runtime_error& e)
    {
        casket::error("Failed to sign handshake transcript with {}: {}", algorithm.toString(), e.what());
        ec = MakeErrorCode(Error::SigningFailure);
    }
    return {};
}

std::vector<uint8_t> TranscriptSigner::sign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                                            const Transcript& transcript) const
{
    std::error_code ec;
    auto signature = sign(privateKey, algorithm, transcript, ec);
    if (ec)
    {
        throw Exception(ec, casket::format("unable to sign handshake transcript with {}", algorithm.toString()));
    }
    return signature;
}

void TranscriptSigner::initSign(crypto::SignatureEngine& engine, Key* privateKey) const
{
    try
    {
        engine.initSign(privateKey);
        return;
    }
    catch (const crypto::CryptoException& e)
    {
        if (!settings_.keyReencoding() || privateKey == nullptr ||
            !settings_.keyReencoders().contains(crypto::AsymmKey::getAlgorithmName(privateKey)))
        {
            throw;
        }
        casket::debug("{} refused {} key ({}), re-encoding it", engine.getAlgorithm(),
                      crypto::AsymmKey::getAlgorithmName(privateKey), e.what());
    }

    auto reencoded = settings_.keyReencoders().reencode(privateKey);
    ThrowIfTrue(reencoded == nullptr, Error::SigningFailure, "key re-encoding produced no key");
    engine.initSign(reencoded);
}

std::vector<uint8_t> TranscriptSigner::doSign(Key* privateKey, const SignatureAndHashAlgorithm& algorithm,
                                              const Transcript& transcript) const
{
    auto engineName = AlgorithmRegistry::resolve(algorithm);
    ThrowIfFalse(engineName.has_value(), Error::UnknownAlgorithm,
                 casket::format("unsupported algorithm {}", algorithm.toString()));

    crypto::SignatureEngine* engine{nullptr};
    try
    {
        engine = &engines_.current(*engineName);
    }
    catch (const crypto::CryptoException& e)
    {
        throw Exception(MakeErrorCode(Error::SigningFailure), e.what());
    }

    utils::Finally cleanup([engine]() { engine->reset(); });

    initSign(*engine, privateKey);

    if (settings_.transcriptTrace())
    {
        casket::debug("Signing transcript with {}:", engine->getAlgorithm());
    }

    size_t index = 0;
    for (const auto* message : transcript)
    {
        ThrowIfTrue(message == nullptr, Error::SigningFailure, "null transcript entry");
        if (settings_.transcriptTrace())
        {
            casket::debug("  [{}] - {}", index, message->toString());
        }
        engine->update(message->toByteArray());
        ++index;
    }

    return engine->sign();
}

} // namespace certverify::dtls
