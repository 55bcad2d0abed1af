/// @file
/// @brief Mapping of signature and hash algorithm codes to signature engines.

#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <certverify/dtls/signature_and_hash_algorithm.hpp>

namespace certverify::dtls
{

class AlgorithmRegistry final
{
public:
    /// @brief Resolves a hash and signature code pair to a signature engine name.
    ///
    /// @return Engine name such as "SHA256withECDSA", or std::nullopt for unknown pairs.
    static std::optional<std::string_view> resolve(uint8_t hashId, uint8_t signatureId) noexcept;

    static std::optional<std::string_view> resolve(const SignatureAndHashAlgorithm& algorithm) noexcept;

    /// @brief Lists every supported pair in preference order.
    static std::vector<SignatureAndHashAlgorithm> supported();
};

} // namespace certverify::dtls
