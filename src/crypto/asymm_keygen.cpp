#include <openssl/evp.h>
#include <openssl/core_names.h>
#include <openssl/rsa.h>

#include <string>

#include <certverify/crypto/asymm_keygen.hpp>
#include <certverify/crypto/exception.hpp>

using namespace certverify;

namespace
{

crypto::KeyCtxPtr createKeygenContext(LibContext* libctx, const char* name, const char* propq)
{
    crypto::KeyCtxPtr ctx(EVP_PKEY_CTX_new_from_name(libctx, name, propq));
    crypto::ThrowIfFalse(ctx != nullptr);
    crypto::ThrowIfFalse(0 < EVP_PKEY_keygen_init(ctx));
    return ctx;
}

crypto::KeyPtr generate(KeyCtx* ctx)
{
    EVP_PKEY* pkey{nullptr};
    crypto::ThrowIfFalse(0 < EVP_PKEY_generate(ctx, &pkey));
    return crypto::KeyPtr{pkey};
}

} // namespace

namespace certverify::crypto::akey
{

namespace ec
{

KeyPtr generate(std::string_view groupName, LibContext* libctx, const char* propq)
{
    std::string group(groupName);
    OSSL_PARAM params[] = {OSSL_PARAM_END, OSSL_PARAM_END};
    params[0] = OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group.data(), 0);

    auto ctx = createKeygenContext(libctx, "EC", propq);
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_params(ctx, params));
    return ::generate(ctx);
}

} // namespace ec

namespace ed
{

KeyPtr generate(std::string_view algorithm, LibContext* libctx, const char* propq)
{
    auto ctx = createKeygenContext(libctx, std::string(algorithm).c_str(), propq);
    return ::generate(ctx);
}

} // namespace ed

namespace rsa
{

KeyPtr generate(size_t bits, LibContext* libctx, const char* propq)
{
    auto ctx = createKeygenContext(libctx, "RSA", propq);
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, static_cast<int>(bits)));
    return ::generate(ctx);
}

} // namespace rsa

} // namespace certverify::crypto::akey
