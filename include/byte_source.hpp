#ifndef BONDCPP_BYTE_SOURCE_HPP
#define BONDCPP_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <vector>

namespace bondcpp {

    // Forward-only view of the input consumed by the decoder.
    class ByteSource {
    public:
        virtual ~ByteSource() = default;

        // Copies the next n bytes into out.
        // Throws TruncatedInputError if fewer than n bytes remain.
        virtual void read(std::byte* out, size_t n) = 0;

        // Advances past the next n bytes without returning them.
        // Throws TruncatedInputError if fewer than n bytes remain.
        virtual void skip(size_t n) = 0;

        // Bytes consumed so far, skipped bytes included.
        virtual size_t position() const = 0;

        uint8_t read_u8();
    };

    class MemorySource : public ByteSource {
    public:
        // Non-owning; data must outlive the source.
        explicit MemorySource(std::span<const std::byte> data);
        // Owning.
        explicit MemorySource(std::vector<std::byte> data);

        MemorySource(const MemorySource&) = delete;
        MemorySource& operator=(const MemorySource&) = delete;

        void read(std::byte* out, size_t n) override;
        void skip(size_t n) override;
        size_t position() const override { return m_pos; }

        size_t remaining() const { return m_data.size() - m_pos; }

    private:
        std::vector<std::byte> m_owned;
        std::span<const std::byte> m_data;
        size_t m_pos;
    };

    class StreamSource : public ByteSource {
    public:
        explicit StreamSource(std::istream& in);

        void read(std::byte* out, size_t n) override;
        void skip(size_t n) override;
        size_t position() const override { return m_pos; }

    private:
        std::istream& m_in;
        size_t m_pos;
    };

} // namespace bondcpp

#endif // BONDCPP_BYTE_SOURCE_HPP
