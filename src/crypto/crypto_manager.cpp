#include <certverify/crypto/crypto_manager.hpp>
#include <certverify/crypto/exception.hpp>

namespace certverify::crypto
{

CryptoManager::CryptoManager()
    : libctx_(nullptr)
{
}

CryptoManager& CryptoManager::getInstance()
{
    static CryptoManager instance;
    return instance;
}

CryptoManager::~CryptoManager() noexcept
{
}

void CryptoManager::setPropertyQuery(std::string_view propertyQuery)
{
    std::lock_guard<std::mutex> lock(mutex_);
    propq_ = std::string(propertyQuery);
}

std::string CryptoManager::getPropertyQuery() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return propq_;
}

LibContext* CryptoManager::getLibContext() const noexcept
{
    return libctx_;
}

HashPtr CryptoManager::fetchDigest(std::string_view algorithm)
{
    const auto propq = getPropertyQuery();
    auto digest = HashPtr(EVP_MD_fetch(libctx_, std::string(algorithm).c_str(), propq.empty() ? nullptr : propq.c_str()));
    ThrowIfTrue(digest == nullptr, "unable to fetch digest");
    return digest;
}

KeyCtxPtr CryptoManager::createKeyContext(std::string_view algorithm)
{
    const auto propq = getPropertyQuery();
    auto ctx = KeyCtxPtr(
        EVP_PKEY_CTX_new_from_name(libctx_, std::string(algorithm).c_str(), propq.empty() ? nullptr : propq.c_str()));
    ThrowIfTrue(ctx == nullptr, "unable to create key context");
    return ctx;
}

} // namespace certverify::crypto
