#pragma once
#include <memory>

namespace certverify::utils
{

template <typename T, void (*f)(T*)>
struct StaticFunctionDeleter
{
    void operator()(T* t) const noexcept
    {
        f(t);
    }
};

} // namespace certverify::utils

/// Declares a unique_ptr flavour which converts implicitly to the raw OpenSSL handle,
/// so owned objects can be passed straight into C API calls.
#define CERTVERIFY_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)                                              \
    struct alias : public std::unique_ptr<object, deleter>                                                             \
    {                                                                                                                  \
        using unique_ptr::unique_ptr;                                                                                  \
                                                                                                                       \
        operator object*() const                                                                                       \
        {                                                                                                              \
            return this->get();                                                                                        \
        }                                                                                                              \
    }

#define CERTVERIFY_DEFINE_UNIQUE_PTR(alias, object, deleter)                                                           \
    using alias##Deleter = ::certverify::utils::StaticFunctionDeleter<object, &deleter>;                               \
    CERTVERIFY_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
