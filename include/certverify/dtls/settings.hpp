/// @file
/// @brief Declaration of the settings used to sign and verify handshake transcripts.

#pragma once
#include <string_view>
#include <certverify/crypto/key_reencoder.hpp>

namespace certverify::dtls
{

/// @brief Class for managing CertificateVerify processing settings.
class Settings final
{
public:
    /// @brief Default constructor: key re-encoding enabled with the EdDSA aliases, no transcript trace.
    Settings();

    /// @brief Destructor.
    ~Settings() noexcept;

    Settings(const Settings& other);

    Settings& operator=(const Settings& other);

    /// @brief Enables or disables re-encoding of private keys refused by a signature engine.
    /// @param enable true to allow the fallback.
    void setKeyReencoding(bool enable) noexcept;

    /// @brief Checks whether re-encoding of refused private keys is allowed.
    bool keyReencoding() const noexcept;

    /// @brief Enables or disables debug logging of every transcript entry fed to an engine.
    void setTranscriptTrace(bool enable) noexcept;

    bool transcriptTrace() const noexcept;

    /// @brief Adds a native key algorithm name which is re-encoded as @p standardName.
    /// @param nativeName Name reported by the key, e.g. an OID.
    /// @param standardName Key type of the standard provider, e.g. "ED25519".
    void addKeyAlias(std::string_view nativeName, std::string_view standardName);

    /// @brief Adds a custom re-encoding strategy for keys reporting @p nativeName.
    void addKeyReencoder(std::string_view nativeName, crypto::KeyReencoderRegistry::Reencoder reencoder);

    const crypto::KeyReencoderRegistry& keyReencoders() const noexcept;

    /// @brief Sets the OpenSSL property query used for every algorithm fetch, process-wide.
    ///
    /// Only engines and key factories created afterwards are affected. Instances a thread has
    /// already cached keep the implementation they were fetched with until their cache is destroyed.
    ///
    /// @param propertyQuery Property query, e.g. "provider=default".
    static void setPropertyQuery(std::string_view propertyQuery);

private:
    bool keyReencoding_;
    bool transcriptTrace_;
    crypto::KeyReencoderRegistry reencoders_;
};

} // namespace certverify::dtls
