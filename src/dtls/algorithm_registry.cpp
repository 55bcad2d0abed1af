#include <iterator>
#include <certverify/dtls/algorithm_registry.hpp>

namespace certverify::dtls
{

namespace
{

using HashAlg = SignatureAndHashAlgorithm::HashAlgorithm;
using SignAlg = SignatureAndHashAlgorithm::SignatureAlgorithm;

struct Entry
{
    SignatureAndHashAlgorithm algorithm;
    std::string_view engine;
};

// Preference order: intrinsic algorithms first, then the strongest hash.
constexpr Entry gEntries[] = {
    {{HashAlg::INTRINSIC, SignAlg::ED25519}, "ED25519"},
    {{HashAlg::INTRINSIC, SignAlg::ED448}, "ED448"},

    {{HashAlg::SHA256, SignAlg::ECDSA}, "SHA256withECDSA"},
    {{HashAlg::SHA384, SignAlg::ECDSA}, "SHA384withECDSA"},
    {{HashAlg::SHA512, SignAlg::ECDSA}, "SHA512withECDSA"},

    {{HashAlg::INTRINSIC, SignAlg::RSA_PSS_RSAE_SHA256}, "SHA256withRSASSA-PSS"},
    {{HashAlg::INTRINSIC, SignAlg::RSA_PSS_RSAE_SHA384}, "SHA384withRSASSA-PSS"},
    {{HashAlg::INTRINSIC, SignAlg::RSA_PSS_RSAE_SHA512}, "SHA512withRSASSA-PSS"},

    {{HashAlg::SHA256, SignAlg::RSA}, "SHA256withRSA"},
    {{HashAlg::SHA384, SignAlg::RSA}, "SHA384withRSA"},
    {{HashAlg::SHA512, SignAlg::RSA}, "SHA512withRSA"},

    {{HashAlg::SHA224, SignAlg::ECDSA}, "SHA224withECDSA"},
    {{HashAlg::SHA224, SignAlg::RSA}, "SHA224withRSA"},

    {{HashAlg::SHA256, SignAlg::DSA}, "SHA256withDSA"},
    {{HashAlg::SHA224, SignAlg::DSA}, "SHA224withDSA"},

    {{HashAlg::SHA1, SignAlg::ECDSA}, "SHA1withECDSA"},
    {{HashAlg::SHA1, SignAlg::RSA}, "SHA1withRSA"},
    {{HashAlg::SHA1, SignAlg::DSA}, "SHA1withDSA"},
};

} // namespace

std::optional<std::string_view> AlgorithmRegistry::resolve(uint8_t hashId, uint8_t signatureId) noexcept
{
    return resolve(SignatureAndHashAlgorithm(hashId, signatureId));
}

std::optional<std::string_view> AlgorithmRegistry::resolve(const SignatureAndHashAlgorithm& algorithm) noexcept
{
    for (const auto& entry : gEntries)
    {
        if (entry.algorithm == algorithm)
        {
            return entry.engine;
        }
    }
    return std::nullopt;
}

std::vector<SignatureAndHashAlgorithm> AlgorithmRegistry::supported()
{
    std::vector<SignatureAndHashAlgorithm> result;
    result.reserve(std::size(gEntries));
    for (const auto& entry : gEntries)
    {
        result.push_back(entry.algorithm);
    }
    return result;
}

} // namespace certverify::dtls
