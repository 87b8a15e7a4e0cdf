#ifndef BONDCPP_EXCEPTION_HPP
#define BONDCPP_EXCEPTION_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bondcpp {

    class exception : public std::runtime_error {
    public:
        explicit exception(const std::string& what) : std::runtime_error(what) {}

        // Short machine-readable name, used as the metrics error label.
        virtual std::string_view kind() const { return "error"; }
    };

    // The byte source ran out before a value was complete.
    class TruncatedInputError : public exception {
    public:
        TruncatedInputError(size_t requested, size_t available)
            : exception("Truncated input: needed " + std::to_string(requested) +
                        " byte(s), " + std::to_string(available) + " available"),
              m_requested(requested), m_available(available) {}

        std::string_view kind() const override { return "truncated_input"; }

        size_t requested() const { return m_requested; }
        size_t available() const { return m_available; }

    private:
        size_t m_requested;
        size_t m_available;
    };

    class StringDecodeError : public exception {
    public:
        explicit StringDecodeError(const std::string& what) : exception(what) {}

        std::string_view kind() const override { return "string_decode"; }
    };

    class WideStringDecodeError : public exception {
    public:
        explicit WideStringDecodeError(const std::string& what) : exception(what) {}

        std::string_view kind() const override { return "wstring_decode"; }
    };

    class UnrecognizedTypeTagError : public exception {
    public:
        explicit UnrecognizedTypeTagError(uint8_t code)
            : exception("Unrecognized type tag " + std::to_string(code)), m_code(code) {}

        std::string_view kind() const override { return "unrecognized_type_tag"; }

        uint8_t code() const { return m_code; }

    private:
        uint8_t m_code;
    };

    class IndexOutOfRangeError : public exception {
    public:
        IndexOutOfRangeError(size_t index, size_t size)
            : exception("Index " + std::to_string(index) + " out of range for " +
                        std::to_string(size) + " element(s)") {}

        std::string_view kind() const override { return "index_out_of_range"; }
    };

    class TypeMismatchError : public exception {
    public:
        explicit TypeMismatchError(const std::string& what) : exception(what) {}

        std::string_view kind() const override { return "type_mismatch"; }
    };

    class DecodeLimitError : public exception {
    public:
        explicit DecodeLimitError(const std::string& what) : exception(what) {}

        std::string_view kind() const override { return "decode_limit"; }
    };

    class StructLengthError : public exception {
    public:
        StructLengthError(uint64_t declared, uint64_t consumed)
            : exception("Struct declared " + std::to_string(declared) +
                        " byte(s) but " + std::to_string(consumed) + " were decoded") {}

        std::string_view kind() const override { return "struct_length"; }
    };

} // namespace bondcpp

#endif // BONDCPP_EXCEPTION_HPP
