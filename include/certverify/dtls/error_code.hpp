/// @file
/// @brief Declaration of error codes reported by handshake message processing.

#pragma once
#include <system_error>

namespace certverify::dtls
{

enum class Error
{
    DecodeError = 1,       ///< Malformed or truncated message bytes.
    UnknownAlgorithm,      ///< The signature and hash algorithm pair is not supported.
    SigningFailure,        ///< The private key could not produce a signature.
    AuthenticationFailure, ///< The signature does not prove possession of the certificate key.
};

std::error_code MakeErrorCode(Error e);

inline std::error_code make_error_code(Error e)
{
    return MakeErrorCode(e);
}

} // namespace certverify::dtls

namespace std
{

template <>
struct is_error_code_enum<certverify::dtls::Error> : true_type
{
};

} // namespace std
