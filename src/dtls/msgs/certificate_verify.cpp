#include <algorithm>

#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>

#include <certverify/dtls/msgs/certificate_verify.hpp>
#include <certverify/dtls/transcript_signer.hpp>
#include <certverify/dtls/exception.hpp>
#include <certverify/utils/data_writer.hpp>

namespace certverify::dtls
{

CertificateVerify::CertificateVerify(const SignatureAndHashAlgorithm& algorithm,
                                     nonstd::span<const uint8_t> signature, std::string peer)
    : HandshakeMessage(std::move(peer))
    , algorithm_(algorithm)
    , signature_(signature.begin(), signature.end())
{
    ThrowIfTrue(signature_.size() > MAX_SIGNATURE_SIZE, Error::DecodeError,
                casket::format("signature is too long: {} bytes", signature_.size()));
}

CertificateVerify CertificateVerify::sign(const SignatureAndHashAlgorithm& algorithm, Key* privateKey,
                                          const Transcript& transcript, std::string peer, const Settings& settings)
{
    TranscriptSigner signer(settings);
    auto signature = signer.sign(privateKey, algorithm, transcript);
    ThrowIfTrue(signature.size() > MAX_SIGNATURE_SIZE, Error::SigningFailure,
                casket::format("{} signature does not fit the message", algorithm.toString()));
    return CertificateVerify(algorithm, signature, std::move(peer));
}

std::optional<CertificateVerify> CertificateVerify::sign(const SignatureAndHashAlgorithm& algorithm, Key* privateKey,
                                                         const Transcript& transcript, std::string peer,
                                                         const Settings& settings, std::error_code& ec)
{
    TranscriptSigner signer(settings);
    auto signature = signer.sign(privateKey, algorithm, transcript, ec);
    if (ec)
    {
        return std::nullopt;
    }
    if (signature.size() > MAX_SIGNATURE_SIZE)
    {
        ec = MakeErrorCode(Error::SigningFailure);
        return std::nullopt;
    }
    return CertificateVerify(algorithm, signature, std::move(peer));
}

CertificateVerify CertificateVerify::deserialize(utils::DataReader& reader, std::string peer)
{
    const uint8_t hash = reader.get_byte();
    const uint8_t signature = reader.get_byte();
    auto blob = reader.get_span(2, 0, MAX_SIGNATURE_SIZE);

    return CertificateVerify(SignatureAndHashAlgorithm(hash, signature), blob, std::move(peer));
}

CertificateVerify CertificateVerify::deserialize(nonstd::span<const uint8_t> input, std::string peer)
{
    utils::DataReader reader("Certificate Verify", input);
    auto message = deserialize(reader, std::move(peer));
    reader.assert_done();
    return message;
}

HandshakeType CertificateVerify::type() const noexcept
{
    return HandshakeType::CertificateVerifyCode;
}

size_t CertificateVerify::messageLength() const noexcept
{
    return 4 + signature_.size();
}

std::vector<uint8_t> CertificateVerify::fragmentToByteArray() const
{
    utils::DataWriter writer(messageLength());
    writer.put_byte(algorithm_.hash());
    writer.put_byte(algorithm_.signature());
    writer.put_uint16_t(static_cast<uint16_t>(signature_.size()));
    writer.put_bytes(signature_);
    return writer.release();
}

size_t CertificateVerify::serialize(nonstd::span<uint8_t> output) const
{
    casket::ThrowIfTrue(output.size() < messageLength(), "buffer is too small");

    const auto body = fragmentToByteArray();
    std::copy(body.begin(), body.end(), output.begin());
    return body.size();
}

VerifyResult CertificateVerify::verifySignature(Key* publicKey, const Transcript& transcript,
                                                const Settings& settings) const
{
    TranscriptVerifier verifier(settings);
    return verifier.verify(publicKey, algorithm_, signature_, transcript, peer());
}

const SignatureAndHashAlgorithm& CertificateVerify::algorithm() const noexcept
{
    return algorithm_;
}

const std::vector<uint8_t>& CertificateVerify::signature() const noexcept
{
    return signature_;
}

std::string CertificateVerify::toString() const
{
    return casket::format("CertificateVerify: {}, signature {} bytes", algorithm_.toString(), signature_.size());
}

} // namespace certverify::dtls
