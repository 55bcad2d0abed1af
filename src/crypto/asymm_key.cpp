#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/crypto.h>
#include <openssl/objects.h>

#include <certverify/crypto/asymm_key.hpp>
#include <certverify/crypto/crypto_manager.hpp>
#include <certverify/crypto/exception.hpp>

namespace certverify::crypto
{

KeyPtr AsymmKey::shallowCopy(Key* key)
{
    if (key)
    {
        crypto::ThrowIfFalse(0 < EVP_PKEY_up_ref(key));
        return KeyPtr{key};
    }
    return nullptr;
}

bool AsymmKey::isAlgorithm(const Key* key, std::string_view alg)
{
    return EVP_PKEY_is_a(key, std::string(alg).c_str());
}

bool AsymmKey::isEqual(const Key* a, const Key* b)
{
    return 0 < EVP_PKEY_eq(a, b);
}

std::string AsymmKey::getAlgorithmName(const Key* key)
{
    const char* name = EVP_PKEY_get0_type_name(key);
    if (name)
    {
        return name;
    }

    // Legacy keys have no provider-side name.
    const char* shortName = OBJ_nid2sn(EVP_PKEY_get_base_id(key));
    return shortName ? shortName : std::string();
}

RawPrivateKey AsymmKey::getRawPrivateKey(const Key* key)
{
    size_t size{0};
    ThrowIfFalse(0 < EVP_PKEY_get_raw_private_key(key, nullptr, &size), "unable to export raw private key");
    ThrowIfTrue(size > RawPrivateKey::capacity(), "raw private key is too long");

    RawPrivateKey rawKey(size);
    ThrowIfFalse(0 < EVP_PKEY_get_raw_private_key(key, rawKey.data(), &size), "unable to export raw private key");
    rawKey.resize(size);
    return rawKey;
}

KeyPtr AsymmKey::getPublicKey(Key* key)
{
    unsigned char* buffer{nullptr};
    int length = i2d_PUBKEY(key, &buffer);
    ThrowIfFalse(length > 0, "unable to encode public key");

    const unsigned char* ptr = buffer;
    const auto propq = CryptoManager::getInstance().getPropertyQuery();
    KeyPtr result(d2i_PUBKEY_ex(nullptr, &ptr, length, CryptoManager::getInstance().getLibContext(),
                                propq.empty() ? nullptr : propq.c_str()));
    OPENSSL_free(buffer);

    ThrowIfTrue(result == nullptr, "unable to decode public key");
    return result;
}

} // namespace certverify::crypto
