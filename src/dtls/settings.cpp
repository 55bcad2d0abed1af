#include <certverify/dtls/settings.hpp>
#include <certverify/crypto/crypto_manager.hpp>

namespace certverify::dtls
{

Settings::Settings()
    : keyReencoding_(true)
    , transcriptTrace_(false)
{
}

Settings::~Settings() noexcept
{
}

Settings::Settings(const Settings& other) = default;

Settings& Settings::operator=(const Settings& other) = default;

void Settings::setKeyReencoding(bool enable) noexcept
{
    keyReencoding_ = enable;
}

bool Settings::keyReencoding() const noexcept
{
    return keyReencoding_;
}

void Settings::setTranscriptTrace(bool enable) noexcept
{
    transcriptTrace_ = enable;
}

bool Settings::transcriptTrace() const noexcept
{
    return transcriptTrace_;
}

void Settings::addKeyAlias(std::string_view nativeName, std::string_view standardName)
{
    reencoders_.addAlias(nativeName, standardName);
}

void Settings::addKeyReencoder(std::string_view nativeName, crypto::KeyReencoderRegistry::Reencoder reencoder)
{
    reencoders_.add(nativeName, std::move(reencoder));
}

const crypto::KeyReencoderRegistry& Settings::keyReencoders() const noexcept
{
    return reencoders_;
}

void Settings::setPropertyQuery(std::string_view propertyQuery)
{
    crypto::CryptoManager::getInstance().setPropertyQuery(propertyQuery);
}

} // namespace certverify::dtls
