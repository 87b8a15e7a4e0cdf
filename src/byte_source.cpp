#include "byte_source.hpp"
#include "exception.hpp"
#include <array>
#include <cstring>
#include <utility>

namespace bondcpp {

    uint8_t ByteSource::read_u8() {
        std::byte b;
        read(&b, 1);
        return static_cast<uint8_t>(b);
    }

    MemorySource::MemorySource(std::span<const std::byte> data) : m_data(data), m_pos(0) {}

    MemorySource::MemorySource(std::vector<std::byte> data)
        : m_owned(std::move(data)), m_data(m_owned), m_pos(0) {}

    void MemorySource::read(std::byte* out, size_t n) {
        if (n > remaining()) {
            throw TruncatedInputError(n, remaining());
        }
        if (n > 0) {
            std::memcpy(out, m_data.data() + m_pos, n);
        }
        m_pos += n;
    }

    void MemorySource::skip(size_t n) {
        if (n > remaining()) {
            throw TruncatedInputError(n, remaining());
        }
        m_pos += n;
    }

    StreamSource::StreamSource(std::istream& in) : m_in(in), m_pos(0) {}

    void StreamSource::read(std::byte* out, size_t n) {
        if (n == 0) {
            return;
        }
        m_in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
        size_t got = static_cast<size_t>(m_in.gcount());
        m_pos += got;
        if (got != n) {
            throw TruncatedInputError(n, got);
        }
    }

    void StreamSource::skip(size_t n) {
        if (n == 0) {
            return;
        }
        // Seek when the stream knows its extent, otherwise read and discard.
        std::istream::pos_type here = m_in.tellg();
        if (here != std::istream::pos_type(-1)) {
            m_in.seekg(0, std::ios::end);
            std::istream::pos_type end = m_in.tellg();
            m_in.seekg(here);
            if (end != std::istream::pos_type(-1) && m_in) {
                size_t available = static_cast<size_t>(end - here);
                if (n > available) {
                    m_in.seekg(end);
                    m_pos += available;
                    throw TruncatedInputError(n, available);
                }
                m_in.seekg(static_cast<std::streamoff>(n), std::ios::cur);
                m_pos += n;
                return;
            }
            m_in.clear();
        }

        std::array<char, 4096> scratch;
        size_t left = n;
        while (left > 0) {
            size_t chunk = left < scratch.size() ? left : scratch.size();
            m_in.read(scratch.data(), static_cast<std::streamsize>(chunk));
            size_t got = static_cast<size_t>(m_in.gcount());
            m_pos += got;
            left -= got;
            if (got != chunk) {
                throw TruncatedInputError(n, n - left);
            }
        }
    }

} // namespace bondcpp
