#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <casket/nonstd/span.hpp>
#include <casket/utils/format.hpp>
#include <certverify/dtls/exception.hpp>

namespace certverify::utils
{

/// @brief Big-endian reader over a message window.
///
/// Every read which runs past the end of the window throws dtls::Exception with Error::DecodeError.
class DataReader final
{
public:
    DataReader(const char* type, nonstd::span<const uint8_t> buf_in)
        : m_typename(type)
        , m_buf(buf_in)
        , m_offset(0)
    {
    }

    void assert_done() const
    {
        if (has_remaining())
        {
            throw_decode_error("Extra bytes at end of message");
        }
    }

    size_t read_so_far() const
    {
        return m_offset;
    }

    size_t remaining_bytes() const
    {
        return m_buf.size() - m_offset;
    }

    bool has_remaining() const
    {
        return (remaining_bytes() > 0);
    }

    nonstd::span<const uint8_t> get_span_remaining()
    {
        auto result = m_buf.subspan(m_offset);
        m_offset = m_buf.size();
        return result;
    }

    void discard_next(size_t bytes)
    {
        assert_at_least(bytes);
        m_offset += bytes;
    }

    uint32_t get_uint24_t()
    {
        assert_at_least(3);
        uint32_t result = (static_cast<uint32_t>(m_buf[m_offset]) << 16) |
                          (static_cast<uint32_t>(m_buf[m_offset + 1]) << 8) | m_buf[m_offset + 2];
        m_offset += 3;
        return result;
    }

    uint16_t get_uint16_t()
    {
        assert_at_least(2);
        uint16_t result = static_cast<uint16_t>((m_buf[m_offset] << 8) | m_buf[m_offset + 1]);
        m_offset += 2;
        return result;
    }

    uint8_t get_byte()
    {
        assert_at_least(1);
        uint8_t result = m_buf[m_offset];
        m_offset += 1;
        return result;
    }

    nonstd::span<const uint8_t> get_span_fixed(size_t size)
    {
        assert_at_least(size);
        auto result = m_buf.subspan(m_offset, size);
        m_offset += size;
        return result;
    }

    /// @brief Reads a length field of @p len_bytes bytes followed by that many bytes.
    nonstd::span<const uint8_t> get_span(size_t len_bytes, size_t min_bytes, size_t max_bytes)
    {
        const size_t length = get_length_field(len_bytes);
        if (length < min_bytes || length > max_bytes)
        {
            throw_decode_error("Length field outside parameters");
        }
        return get_span_fixed(length);
    }

    std::vector<uint8_t> get_range(size_t len_bytes, size_t min_bytes, size_t max_bytes)
    {
        auto value = get_span(len_bytes, min_bytes, max_bytes);
        return std::vector<uint8_t>(value.begin(), value.end());
    }

private:
    size_t get_length_field(size_t len_bytes)
    {
        if (len_bytes == 1)
        {
            return get_byte();
        }
        else if (len_bytes == 2)
        {
            return get_uint16_t();
        }
        else if (len_bytes == 3)
        {
            return get_uint24_t();
        }

        throw_decode_error("Bad length size");
    }

    void assert_at_least(size_t n) const
    {
        if (m_buf.size() - m_offset < n)
        {
            throw_decode_error("Expected " + std::to_string(n) + " bytes remaining, only " +
                               std::to_string(m_buf.size() - m_offset) + " left");
        }
    }

    [[noreturn]] void throw_decode_error(std::string_view why) const
    {
        throw dtls::Exception(dtls::MakeErrorCode(dtls::Error::DecodeError),
                              casket::format("Invalid {}: {}", m_typename, why));
    }

    const char* m_typename;
    nonstd::span<const uint8_t> m_buf;
    size_t m_offset;
};

} // namespace certverify::utils
