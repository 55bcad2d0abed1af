#include <certverify/dtls/error_code.hpp>
#include <certverify/dtls/error_category.hpp>

namespace certverify::dtls
{

std::error_code MakeErrorCode(Error e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::getInstance());
}

} // namespace certverify::dtls
