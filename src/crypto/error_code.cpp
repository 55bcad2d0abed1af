#include <openssl/err.h>
#include <certverify/crypto/error_code.hpp>
#include <certverify/crypto/error_category.hpp>

namespace certverify::crypto
{

std::error_code TranslateError(unsigned long error)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }
#endif // (OPENSSL_VERSION_NUMBER >= 0x30000000L)

    return std::error_code{static_cast<int>(error), ErrorCategory::getInstance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    if (err)
    {
        // Keep the innermost reason and drop the rest of the queue, so that
        // a later failure on this thread doesn't report a stale error.
        ::ERR_clear_error();
        return TranslateError(err);
    }
    return TranslateError(ERR_R_OPERATION_FAIL);
}

void ClearErrors() noexcept
{
    ::ERR_clear_error();
}

} // namespace certverify::crypto
