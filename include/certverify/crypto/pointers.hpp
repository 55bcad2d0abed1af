#pragma once
#include <openssl/evp.h>

#include <certverify/crypto/typedefs.hpp>
#include <certverify/utils/custom_unique_ptr.hpp>

namespace certverify::crypto
{

CERTVERIFY_DEFINE_UNIQUE_PTR(KeyPtr, Key, EVP_PKEY_free);
CERTVERIFY_DEFINE_UNIQUE_PTR(KeyCtxPtr, KeyCtx, EVP_PKEY_CTX_free);
CERTVERIFY_DEFINE_UNIQUE_PTR(HashPtr, Hash, EVP_MD_free);
CERTVERIFY_DEFINE_UNIQUE_PTR(HashCtxPtr, HashCtx, EVP_MD_CTX_free);

} // namespace certverify::crypto
