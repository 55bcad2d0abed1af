/// @file
/// @brief Declaration of the signature and hash algorithm pair.

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace certverify::dtls
{

/// @brief Pair of hash and signature algorithm codes (RFC 5246, section 7.4.1.4.1).
///
/// Any pair of byte values is representable, only pairs known to the AlgorithmRegistry
/// can be used to sign or verify.
class SignatureAndHashAlgorithm final
{
public:
    enum HashAlgorithm : uint8_t
    {
        NONE = 0,
        MD5 = 1,
        SHA1 = 2,
        SHA224 = 3,
        SHA256 = 4,
        SHA384 = 5,
        SHA512 = 6,
        INTRINSIC = 8, ///< RFC 8422, RFC 8446: hash is part of the signature algorithm
    };

    enum SignatureAlgorithm : uint8_t
    {
        ANONYMOUS = 0,
        RSA = 1,
        DSA = 2,
        ECDSA = 3,
        RSA_PSS_RSAE_SHA256 = 4,
        RSA_PSS_RSAE_SHA384 = 5,
        RSA_PSS_RSAE_SHA512 = 6,
        ED25519 = 7,
        ED448 = 8,
    };

public:
    constexpr SignatureAndHashAlgorithm() noexcept
        : hash_(NONE)
        , signature_(ANONYMOUS)
    {
    }

    constexpr SignatureAndHashAlgorithm(uint8_t hash, uint8_t signature) noexcept
        : hash_(hash)
        , signature_(signature)
    {
    }

    constexpr uint8_t hash() const noexcept
    {
        return hash_;
    }

    constexpr uint8_t signature() const noexcept
    {
        return signature_;
    }

    /// @brief Two-byte code as used in the signature_algorithms extension.
    constexpr uint16_t wireCode() const noexcept
    {
        return static_cast<uint16_t>((hash_ << 8) | signature_);
    }

    inline bool operator==(const SignatureAndHashAlgorithm& rhs) const noexcept
    {
        return hash_ == rhs.hash_ && signature_ == rhs.signature_;
    }

    inline bool operator!=(const SignatureAndHashAlgorithm& rhs) const noexcept
    {
        return !(*this == rhs);
    }

    /// @brief Gets the engine name registered for this pair.
    ///
    /// @return Engine name, or std::nullopt for unsupported pairs.
    std::optional<std::string_view> engineName() const noexcept;

    bool isSupported() const noexcept;

    std::string toString() const;

private:
    uint8_t hash_;
    uint8_t signature_;
};

} // namespace certverify::dtls
