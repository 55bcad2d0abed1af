#pragma once
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <openssl/crypto.h>
#include <casket/nonstd/span.hpp>

namespace certverify::crypto
{

/// @brief Fixed-capacity buffer for secret material, wiped on destruction and when moved from.
template <typename T, size_t N>
class SecureArray final
{
public:
    using value_type = T;
    using size_type = size_t;
    using iterator = T*;
    using const_iterator = const T*;

    SecureArray()
        : size_(0)
    {
    }

    explicit SecureArray(size_type size)
        : size_(0)
    {
        resize(size);
    }

    ~SecureArray() noexcept
    {
        OPENSSL_cleanse(data_, sizeof(data_));
    }

    SecureArray(const SecureArray&) = delete;
    SecureArray& operator=(const SecureArray&) = delete;

    SecureArray(SecureArray&& other) noexcept
        : size_(other.size_)
    {
        std::copy_n(other.data_, size_, data_);
        other.wipe();
    }

    SecureArray& operator=(SecureArray&& other) noexcept
    {
        if (this != &other)
        {
            wipe();
            size_ = other.size_;
            std::copy_n(other.data_, size_, data_);
            other.wipe();
        }
        return *this;
    }

    operator nonstd::span<const T>() const noexcept
    {
        return nonstd::span<const T>(data_, size_);
    }

    /// @throws std::out_of_range if @p newSize exceeds the capacity.
    void resize(size_type newSize)
    {
        if (newSize > N)
        {
            throw std::out_of_range("Requested size exceeds maximum capacity");
        }

        if (newSize < size_)
        {
            OPENSSL_cleanse(data_ + newSize, (size_ - newSize) * sizeof(T));
        }
        else if (newSize > size_)
        {
            std::fill_n(data_ + size_, newSize - size_, T{});
        }
        size_ = newSize;
    }

    const T& operator[](size_type pos) const
    {
        return data_[pos];
    }

    T* data() noexcept
    {
        return data_;
    }

    const T* data() const noexcept
    {
        return data_;
    }

    const_iterator begin() const noexcept
    {
        return data_;
    }

    const_iterator end() const noexcept
    {
        return data_ + size_;
    }

    size_type size() const noexcept
    {
        return size_;
    }

    static constexpr size_type capacity() noexcept
    {
        return N;
    }

    bool empty() const noexcept
    {
        return size_ == 0;
    }

    void clear() noexcept
    {
        wipe();
    }

private:
    void wipe() noexcept
    {
        OPENSSL_cleanse(data_, sizeof(data_));
        size_ = 0;
    }

    T data_[N];
    size_type size_;
};

} // namespace certverify::crypto
