#include <openssl/err.h>
#include <certverify/crypto/error_category.hpp>

namespace certverify::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const char* reason = ::ERR_reason_error_string(value);
    if (reason)
    {
        const char* lib = ::ERR_lib_error_string(value);
        std::string result(reason);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

} // namespace certverify::crypto
