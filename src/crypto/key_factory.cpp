#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/params.h>

#include <certverify/crypto/key_factory.hpp>
#include <certverify/crypto/crypto_manager.hpp>
#include <certverify/crypto/exception.hpp>

namespace certverify::crypto
{

KeyFactory::KeyFactory(std::string_view algorithm)
    : algorithm_(algorithm)
    , ctx_(CryptoManager::getInstance().createKeyContext(algorithm))
{
}

KeyFactory::~KeyFactory() noexcept
{
}

const std::string& KeyFactory::getAlgorithm() const noexcept
{
    return algorithm_;
}

KeyPtr KeyFactory::generatePrivate(nonstd::span<const uint8_t> rawPrivateKey)
{
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PRIV_KEY, const_cast<uint8_t*>(rawPrivateKey.data()),
                                          rawPrivateKey.size()),
        OSSL_PARAM_construct_end(),
    };

    ThrowIfFalse(0 < EVP_PKEY_fromdata_init(ctx_));

    Key* key{nullptr};
    ThrowIfFalse(0 < EVP_PKEY_fromdata(ctx_, &key, EVP_PKEY_KEYPAIR, params), "unable to build private key");
    return KeyPtr{key};
}

EngineCache<KeyFactory>& KeyFactory::defaultCache()
{
    static EngineCache<KeyFactory> cache(
        [](const std::string& algorithm) { return std::make_unique<KeyFactory>(algorithm); });
    return cache;
}

} // namespace certverify::crypto
