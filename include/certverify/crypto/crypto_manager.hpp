#pragma once
#include <mutex>
#include <string>
#include <string_view>
#include <certverify/crypto/pointers.hpp>
#include <casket/utils/noncopyable.hpp>

namespace certverify::crypto
{

/// @brief Process-wide access point to the OpenSSL library context.
///
/// Every digest, signature and key management implementation used by the library is fetched
/// through this object so that a single property query selects the provider for all of them.
class CryptoManager final : public casket::NonCopyable
{
private:
    CryptoManager();

public:
    static CryptoManager& getInstance();

    ~CryptoManager() noexcept;

    /// @brief Sets the property query applied to all subsequent fetches, e.g. "provider=default".
    ///
    /// Objects fetched before the call are left as they are.
    void setPropertyQuery(std::string_view propertyQuery);

    std::string getPropertyQuery() const;

    LibContext* getLibContext() const noexcept;

    HashPtr fetchDigest(std::string_view algorithm);

    KeyCtxPtr createKeyContext(std::string_view algorithm);

private:
    LibContext* libctx_;
    mutable std::mutex mutex_;
    std::string propq_;
};

} // namespace certverify::crypto
