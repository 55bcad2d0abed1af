#include <casket/utils/format.hpp>

#include <certverify/dtls/signature_and_hash_algorithm.hpp>
#include <certverify/dtls/algorithm_registry.hpp>

namespace certverify::dtls
{

namespace
{

const char* HashToString(uint8_t hash)
{
    switch (hash)
    {
    case SignatureAndHashAlgorithm::NONE:
        return "none";
    case SignatureAndHashAlgorithm::MD5:
        return "md5";
    case SignatureAndHashAlgorithm::SHA1:
        return "sha1";
    case SignatureAndHashAlgorithm::SHA224:
        return "sha224";
    case SignatureAndHashAlgorithm::SHA256:
        return "sha256";
    case SignatureAndHashAlgorithm::SHA384:
        return "sha384";
    case SignatureAndHashAlgorithm::SHA512:
        return "sha512";
    case SignatureAndHashAlgorithm::INTRINSIC:
        return "intrinsic";
    default:
        return nullptr;
    }
}

const char* SignatureToString(uint8_t signature)
{
    switch (signature)
    {
    case SignatureAndHashAlgorithm::ANONYMOUS:
        return "anonymous";
    case SignatureAndHashAlgorithm::RSA:
        return "rsa";
    case SignatureAndHashAlgorithm::DSA:
        return "dsa";
    case SignatureAndHashAlgorithm::ECDSA:
        return "ecdsa";
    case SignatureAndHashAlgorithm::RSA_PSS_RSAE_SHA256:
        return "rsa_pss_rsae_sha256";
    case SignatureAndHashAlgorithm::RSA_PSS_RSAE_SHA384:
        return "rsa_pss_rsae_sha384";
    case SignatureAndHashAlgorithm::RSA_PSS_RSAE_SHA512:
        return "rsa_pss_rsae_sha512";
    case SignatureAndHashAlgorithm::ED25519:
        return "ed25519";
    case SignatureAndHashAlgorithm::ED448:
        return "ed448";
    default:
        return nullptr;
    }
}

} // namespace

std::optional<std::string_view> SignatureAndHashAlgorithm::engineName() const noexcept
{
    return AlgorithmRegistry::resolve(*this);
}

bool SignatureAndHashAlgorithm::isSupported() const noexcept
{
    return engineName().has_value();
}

std::string SignatureAndHashAlgorithm::toString() const
{
    const char* hash = HashToString(hash_);
    const char* signature = SignatureToString(signature_);

    return casket::format("{}with{}", hash ? std::string(hash) : "unknown_" + std::to_string(hash_),
                          signature ? std::string(signature) : "unknown_" + std::to_string(signature_));
}

} // namespace certverify::dtls
