/// @file
/// @brief Exception types for handshake message errors.

#pragma once

#include <string>
#include <system_error>
#include <stdexcept>

#include <certverify/dtls/alert.hpp>
#include <certverify/dtls/error_code.hpp>

namespace certverify::dtls
{

/// @brief Main class for handshake message exceptions.
class Exception : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param ec Error code.
    explicit Exception(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param ec Error code.
    /// @param what_arg Error message.
    Exception(std::error_code ec, const std::string& what_arg)
        : std::system_error(ec, what_arg)
    {
    }
};

/// @brief Exception which aborts the handshake and carries the alert to send to the peer.
class HandshakeException final : public Exception
{
public:
    HandshakeException(std::error_code ec, const std::string& what_arg, Alert alert)
        : Exception(ec, what_arg)
        , alert_(std::move(alert))
    {
    }

    const Alert& alert() const noexcept
    {
        return alert_;
    }

private:
    Alert alert_;
};

/// @brief Throws an exception with @p error if @p exprResult is true.
///
/// @param exprResult The result of the expression to check.
/// @param error Error to report.
/// @param msg Additional message.
inline void ThrowIfTrue(bool exprResult, Error error, const std::string& msg)
{
    if (exprResult)
    {
        throw Exception(MakeErrorCode(error), msg);
    }
}

/// @brief Throws an exception with @p error if @p exprResult is false.
///
/// @param exprResult The result of the expression to check.
/// @param error Error to report.
/// @param msg Additional message.
inline void ThrowIfFalse(bool exprResult, Error error, const std::string& msg)
{
    return ThrowIfTrue(!exprResult, error, msg);
}

} // namespace certverify::dtls
