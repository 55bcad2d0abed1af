#include <algorithm>
#include <iterator>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rsa.h>
#include <openssl/objects.h>

#include <casket/utils/exception.hpp>
#include <casket/utils/format.hpp>

#include <certverify/crypto/signature_engine.hpp>
#include <certverify/crypto/signature.hpp>
#include <certverify/crypto/asymm_key.hpp>
#include <certverify/crypto/crypto_manager.hpp>
#include <certverify/crypto/exception.hpp>

namespace certverify::crypto
{

enum class Padding
{
    None,
    Pss
};

struct SignatureEngine::Params final
{
    std::string_view name;
    const char* digest; ///< nullptr for algorithms hashing internally
    const char* signature;
    std::string_view keyAlgorithm;
    Padding padding;
};

static const SignatureEngine::Params gEngines[] = {
    {"SHA1withRSA", SN_sha1, "RSA", "RSA", Padding::None},
    {"SHA224withRSA", SN_sha224, "RSA", "RSA", Padding::None},
    {"SHA256withRSA", SN_sha256, "RSA", "RSA", Padding::None},
    {"SHA384withRSA", SN_sha384, "RSA", "RSA", Padding::None},
    {"SHA512withRSA", SN_sha512, "RSA", "RSA", Padding::None},

    {"SHA1withDSA", SN_sha1, "DSA", "DSA", Padding::None},
    {"SHA224withDSA", SN_sha224, "DSA", "DSA", Padding::None},
    {"SHA256withDSA", SN_sha256, "DSA", "DSA", Padding::None},

    {"SHA1withECDSA", SN_sha1, "ECDSA", "EC", Padding::None},
    {"SHA224withECDSA", SN_sha224, "ECDSA", "EC", Padding::None},
    {"SHA256withECDSA", SN_sha256, "ECDSA", "EC", Padding::None},
    {"SHA384withECDSA", SN_sha384, "ECDSA", "EC", Padding::None},
    {"SHA512withECDSA", SN_sha512, "ECDSA", "EC", Padding::None},

    {"SHA256withRSASSA-PSS", SN_sha256, "RSA", "RSA", Padding::Pss},
    {"SHA384withRSASSA-PSS", SN_sha384, "RSA", "RSA", Padding::Pss},
    {"SHA512withRSASSA-PSS", SN_sha512, "RSA", "RSA", Padding::Pss},

    {"ED25519", nullptr, "ED25519", "ED25519", Padding::None},
    {"ED448", nullptr, "ED448", "ED448", Padding::None},
};

static const SignatureEngine::Params* FindParams(std::string_view algorithm)
{
    auto found = std::find_if(std::begin(gEngines), std::end(gEngines),
                              [algorithm](const auto& params) { return params.name == algorithm; });
    return found != std::end(gEngines) ? found : nullptr;
}

static inline void SetPssSettings(KeyCtx* ctx)
{
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_padding(ctx, RSA_PKCS1_PSS_PADDING));
    crypto::ThrowIfFalse(0 < EVP_PKEY_CTX_set_rsa_pss_saltlen(ctx, RSA_PSS_SALTLEN_DIGEST));
}

SignatureEngine::SignatureEngine(std::string_view algorithm)
    : algorithm_(algorithm)
    , params_(FindParams(algorithm))
    , hash_(nullptr)
    , ctx_(EVP_MD_CTX_new())
    , state_(State::Idle)
{
    if (!params_)
    {
        throw CryptoException(TranslateError(ERR_PACK(ERR_LIB_EVP, 0, EVP_R_UNSUPPORTED_ALGORITHM)),
                              casket::format("unsupported signature algorithm '{}'", algorithm));
    }

    ThrowIfTrue(ctx_ == nullptr, "bad alloc");

    if (params_->digest)
    {
        hash_ = CryptoManager::getInstance().fetchDigest(params_->digest);
    }

    // Make sure the provider implements the signature itself, so an engine that
    // was created successfully can only fail later because of the key.
    const auto propq = CryptoManager::getInstance().getPropertyQuery();
    EVP_SIGNATURE* signature = EVP_SIGNATURE_fetch(CryptoManager::getInstance().getLibContext(), params_->signature,
                                                   propq.empty() ? nullptr : propq.c_str());
    ThrowIfTrue(signature == nullptr, casket::format("signature algorithm '{}' is not available", algorithm));
    EVP_SIGNATURE_free(signature);
}

SignatureEngine::~SignatureEngine() noexcept
{
}

const std::string& SignatureEngine::getAlgorithm() const noexcept
{
    return algorithm_;
}

std::string_view SignatureEngine::getKeyAlgorithm() const noexcept
{
    return params_->keyAlgorithm;
}

bool SignatureEngine::isOneShot() const noexcept
{
    return params_->digest == nullptr;
}

void SignatureEngine::initSign(Key* privateKey)
{
    reset();
    checkKey(privateKey);

    KeyCtx* keyCtx{nullptr};
    Signature::signInit(ctx_, hash_, privateKey, &keyCtx);
    if (params_->padding == Padding::Pss)
    {
        SetPssSettings(keyCtx);
    }
    state_ = State::Signing;
}

void SignatureEngine::initVerify(Key* publicKey)
{
    reset();
    checkKey(publicKey);

    KeyCtx* keyCtx{nullptr};
    Signature::verifyInit(ctx_, hash_, publicKey, &keyCtx);
    if (params_->padding == Padding::Pss)
    {
        SetPssSettings(keyCtx);
    }
    state_ = State::Verifying;
}

void SignatureEngine::update(nonstd::span<const uint8_t> message)
{
    if (isOneShot())
    {
        casket::ThrowIfTrue(state_ == State::Idle, "SignatureEngine: not initialized");
        buffer_.insert(buffer_.end(), message.begin(), message.end());
    }
    else if (state_ == State::Signing)
    {
        Signature::signUpdate(ctx_, message);
    }
    else
    {
        checkState(State::Verifying);
        Signature::verifyUpdate(ctx_, message);
    }
}

std::vector<uint8_t> SignatureEngine::sign()
{
    checkState(State::Signing);

    std::vector<uint8_t> signature;
    if (isOneShot())
    {
        signature.resize(Signature::sign(ctx_, {}, buffer_));
        signature.resize(Signature::sign(ctx_, signature, buffer_));
    }
    else
    {
        signature.resize(Signature::signFinal(ctx_, {}));
        signature.resize(Signature::signFinal(ctx_, signature));
    }

    reset();
    return signature;
}

bool SignatureEngine::verify(nonstd::span<const uint8_t> signature)
{
    checkState(State::Verifying);

    bool result = isOneShot() ? Signature::verify(ctx_, signature, buffer_) : Signature::verifyFinal(ctx_, signature);

    // A mismatch leaves its reason on the error queue.
    ClearErrors();
    reset();
    return result;
}

void SignatureEngine::reset() noexcept
{
    EVP_MD_CTX_reset(ctx_);
    std::fill(buffer_.begin(), buffer_.end(), 0);
    buffer_.clear();
    state_ = State::Idle;
}

void SignatureEngine::checkKey(const Key* key) const
{
    if (key == nullptr)
    {
        throw CryptoException(TranslateError(ERR_PACK(ERR_LIB_EVP, 0, ERR_R_PASSED_NULL_PARAMETER)), "no key");
    }

    if (!AsymmKey::isAlgorithm(key, params_->keyAlgorithm))
    {
        throw CryptoException(TranslateError(ERR_PACK(ERR_LIB_EVP, 0, EVP_R_DIFFERENT_KEY_TYPES)),
                              casket::format("{} key can't be used with {}", AsymmKey::getAlgorithmName(key),
                                             algorithm_));
    }
}

void SignatureEngine::checkState(State expected) const
{
    casket::ThrowIfTrue(state_ != expected, "SignatureEngine: invalid state for the operation");
}

EngineCache<SignatureEngine>& SignatureEngine::defaultCache()
{
    static EngineCache<SignatureEngine> cache(
        [](const std::string& algorithm) { return std::make_unique<SignatureEngine>(algorithm); });
    return cache;
}

} // namespace certverify::crypto
