#pragma once
#include <cstdint>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/exception.hpp>
#include <casket/utils/load_store.hpp>

namespace certverify::utils
{

/// @brief Big-endian writer appending to a byte vector.
class DataWriter final
{
public:
    DataWriter() = default;

    explicit DataWriter(size_t capacity)
    {
        m_buf.reserve(capacity);
    }

    void put_byte(uint8_t value)
    {
        m_buf.push_back(value);
    }

    void put_uint16_t(uint16_t value)
    {
        m_buf.push_back(casket::get_byte<0>(value));
        m_buf.push_back(casket::get_byte<1>(value));
    }

    void put_uint24_t(uint32_t value)
    {
        casket::ThrowIfTrue(value > 0xFFFFFF, "DataWriter: value does not fit into 24 bits");
        m_buf.push_back(casket::get_byte<1>(value));
        m_buf.push_back(casket::get_byte<2>(value));
        m_buf.push_back(casket::get_byte<3>(value));
    }

    void put_bytes(nonstd::span<const uint8_t> value)
    {
        m_buf.insert(m_buf.end(), value.begin(), value.end());
    }

    size_t size() const noexcept
    {
        return m_buf.size();
    }

    std::vector<uint8_t> release() noexcept
    {
        return std::move(m_buf);
    }

private:
    std::vector<uint8_t> m_buf;
};

} // namespace certverify::utils
