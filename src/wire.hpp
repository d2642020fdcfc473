#pragma once

#include "common.hpp"

#include <stdexcept>

namespace detsim
{
    // Little-endian byte codec for persisted event trails.
    class WireWriter
    {
    public:
        void write_u8(std::uint8_t v) { m_buf.push_back(static_cast<std::byte>(v)); }
        void write_u32(std::uint32_t v) { write_le_(v, 4); }
        void write_u64(std::uint64_t v) { write_le_(v, 8); }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        void write_le_(std::uint64_t v, int width)
        {
            for (int i = 0; i < width; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        std::uint8_t read_u8() { return static_cast<std::uint8_t>(read_le_(1)); }
        std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_le_(4)); }
        std::uint64_t read_u64() { return read_le_(8); }

        // Decoders of fixed-layout records call this to reject trailing garbage.
        void expect_end() const
        {
            if (m_pos < m_bytes.size())
            {
                throw std::runtime_error("WireReader: trailing bytes");
            }
        }

    private:
        std::uint64_t read_le_(std::size_t width)
        {
            require_(width);
            std::uint64_t out = 0;
            for (std::size_t i = 0; i < width; ++i)
            {
                out |= static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i);
            }
            return out;
        }

        void require_(std::size_t n) const
        {
            if (m_pos + n > m_bytes.size())
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
