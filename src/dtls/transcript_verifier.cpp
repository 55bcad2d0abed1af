#include <stdexcept>
#include <casket/log/log_manager.hpp>
#include <casket/utils/format.hpp>

#include <certverify/dtls/transcript_verifier.hpp>
#include <certverify/dtls/algorithm_registry.hpp>
#include <certverify/dtls/exception.hpp>
#include <certverify/crypto/exception.hpp>
#include <certverify/utils/finally.hpp>

namespace certverify::dtls
{

VerifyResult::VerifyResult(std::error_code ec, Alert alert)
    : error_(ec)
    , alert_(std::move(alert))
{
}

VerifyResult VerifyResult::success()
{
    return VerifyResult(std::error_code(), Alert());
}

VerifyResult VerifyResult::failure(std::string peer)
{
    return VerifyResult(MakeErrorCode(Error::AuthenticationFailure),
                        Alert(Alert::HandshakeFailure, true, std::move(peer)));
}

void VerifyResult::throwIfFailed() const
{
    if (error_)
    {
        throw HandshakeException(error_, "certificate verification message is invalid", alert_);
    }
}

TranscriptVerifier::TranscriptVerifier(const Settings& settings)
    : TranscriptVerifier(settings, crypto::SignatureEngine::defaultCache())
{
}

TranscriptVerifier::TranscriptVerifier(const Settings& settings,
                                       crypto::EngineCache<crypto::SignatureEngine>& engines)
    : settings_(settings)
    , engines_(engines)
{
}

VerifyResult TranscriptVerifier::verify(Key* publicKey, const SignatureAndHashAlgorithm& algorithm,
                                        nonstd::span<const uint8_t> signature, const Transcript& transcript,
                                        const std::string& peer) const
{
    try
    {
        if (doVerify(publicKey, algorithm, signature, transcript))
        {
            return VerifyResult::success();
        }
        casket::error("Certificate verification for {} failed: signature mismatch ({})", peer,
                      algorithm.toString());
    }
    catch (const Exception& e)
    {
        casket::error("Certificate verification for {} failed: {}", peer, e.what());
    }
    catch (const crypto::CryptoException& e)
    {
        casket::error("Certificate verification for {} failed: {}", peer, e.what());
    }
    catch (const std::runtime_error& e)
    {
        casket::error("Certificate verification for {} failed: {}", peer, e.what());
    }
    return VerifyResult::failure(peer);
}

bool TranscriptVerifier::doVerify(Key* publicKey, const SignatureAndHashAlgorithm& algorithm,
                                  nonstd::span<const uint8_t> signature, const Transcript& transcript) const
{
    auto engineName = AlgorithmRegistry::resolve(algorithm);
    ThrowIfFalse(engineName.has_value(), Error::UnknownAlgorithm,
                 casket::format("unsupported algorithm {}", algorithm.toString()));

    auto& engine = engines_.current(*engineName);
    utils::Finally cleanup([&engine]() { engine.reset(); });

    engine.initVerify(publicKey);

    if (settings_.transcriptTrace())
    {
        casket::debug("Verifying transcript with {}:", engine.getAlgorithm());
    }

    size_t index = 0;
    for (const auto* message : transcript)
    {
        ThrowIfTrue(message == nullptr, Error::AuthenticationFailure, "null transcript entry");
        if (settings_.transcriptTrace())
        {
            casket::debug("  [{}] - {}", index, message->toString());
        }
        engine.update(message->toByteArray());
        ++index;
    }

    return engine.verify(signature);
}

} // namespace certverify::dtls
