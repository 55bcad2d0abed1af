#pragma once
#include <string_view>
#include <certverify/crypto/pointers.hpp>

namespace certverify::crypto::akey
{

namespace ec
{

KeyPtr generate(std::string_view groupName, LibContext* libctx = nullptr, const char* propq = nullptr);

} // namespace ec

namespace ed
{

/// @param algorithm Either "ED25519" or "ED448".
KeyPtr generate(std::string_view algorithm, LibContext* libctx = nullptr, const char* propq = nullptr);

} // namespace ed

namespace rsa
{

KeyPtr generate(size_t bits, LibContext* libctx = nullptr, const char* propq = nullptr);

} // namespace rsa

} // namespace certverify::crypto::akey
