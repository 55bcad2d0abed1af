#include <algorithm>
#include <cctype>

#include <certverify/crypto/key_reencoder.hpp>
#include <certverify/crypto/key_factory.hpp>
#include <certverify/crypto/asymm_key.hpp>

namespace certverify::crypto
{

static std::string ToUpper(std::string_view name)
{
    std::string result(name);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

KeyPtr ReencodeRawPrivateKey(Key* key, std::string_view standardName)
{
    auto rawKey = AsymmKey::getRawPrivateKey(key);
    auto& factory = KeyFactory::defaultCache().current(standardName);
    return factory.generatePrivate(rawKey);
}

KeyReencoderRegistry::KeyReencoderRegistry()
    : KeyReencoderRegistry(true)
{
}

KeyReencoderRegistry::KeyReencoderRegistry(bool withDefaults)
{
    if (withDefaults)
    {
        for (auto name : {"ED25519", "1.3.101.112", "OID.1.3.101.112"})
        {
            addAlias(name, "ED25519");
        }
        for (auto name : {"ED448", "1.3.101.113", "OID.1.3.101.113"})
        {
            addAlias(name, "ED448");
        }
    }
}

KeyReencoderRegistry KeyReencoderRegistry::empty()
{
    return KeyReencoderRegistry(false);
}

void KeyReencoderRegistry::add(std::string_view nativeName, Reencoder reencoder)
{
    reencoders_[ToUpper(nativeName)] = std::move(reencoder);
}

void KeyReencoderRegistry::addAlias(std::string_view nativeName, std::string_view standardName)
{
    add(nativeName, [name = std::string(standardName)](Key* key) { return ReencodeRawPrivateKey(key, name); });
}

bool KeyReencoderRegistry::contains(std::string_view nativeName) const
{
    return reencoders_.find(ToUpper(nativeName)) != reencoders_.end();
}

KeyPtr KeyReencoderRegistry::reencode(Key* key) const
{
    auto found = reencoders_.find(ToUpper(AsymmKey::getAlgorithmName(key)));
    if (found == reencoders_.end())
    {
        return nullptr;
    }
    return found->second(key);
}

} // namespace certverify::crypto
