#pragma once
#include <functional>

namespace certverify::utils
{

/// @brief Runs the cleanup action when leaving the scope, on both normal and exceptional paths.
class Finally final
{
public:
    explicit Finally(std::function<void()> cleanup)
        : cleanup_(std::move(cleanup))
    {
    }

    ~Finally()
    {
        if (cleanup_)
        {
            cleanup_();
        }
    }

    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;

private:
    std::function<void()> cleanup_;
};

} // namespace certverify::utils
