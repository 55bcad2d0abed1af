#include <certverify/dtls/error_category.hpp>
#include <certverify/dtls/error_code.hpp>

namespace certverify::dtls
{

const char* ErrorCategory::name() const noexcept
{
    return "certverify";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::DecodeError:
        return "malformed handshake message";
    case Error::UnknownAlgorithm:
        return "unsupported signature and hash algorithm";
    case Error::SigningFailure:
        return "unable to sign handshake transcript";
    case Error::AuthenticationFailure:
        return "handshake transcript signature is invalid";
    }

    return "unknown error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

} // namespace certverify::dtls
