#include "reader.hpp"
#include "byte_source.hpp"
#include "exception.hpp"
#include "observability.hpp"
#include "utils/utf.hpp"
#include "varint.hpp"
#include "wire.hpp"
#include <algorithm>
#include <bit>
#include <chrono>
#include <cstring>
#include <limits>
#include <string>
#include <vector>

namespace bondcpp {

    namespace {

        template <typename T>
        T read_little_endian(ByteSource& source) {
            std::byte raw[sizeof(T)];
            source.read(raw, sizeof(T));
            if constexpr (std::endian::native == std::endian::big) {
                std::reverse(raw, raw + sizeof(T));
            }
            T value;
            std::memcpy(&value, raw, sizeof(T));
            return value;
        }

        class Reader {
        public:
            Reader(ByteSource& source, const DecodeOptions& options)
                : m_source(source), m_options(options), m_depth(0) {}

            Sequence read_struct() {
                DepthGuard guard(*this);
                uint64_t declared = decode_uleb128(m_source);
                size_t start = m_source.position();

                Sequence fields;
                while (true) {
                    FieldHeader header = read_field_header(m_source);
                    Value field = read_value(header.id, header.type);
                    if (header.type == Type::Stop) {
                        break;
                    }
                    if (header.type == Type::StopBase) {
                        continue;
                    }
                    fields.push_back(std::move(field));
                }

                if (m_options.check_struct_length) {
                    uint64_t consumed = m_source.position() - start;
                    if (consumed != declared) {
                        throw StructLengthError(declared, consumed);
                    }
                }
                return fields;
            }

        private:
            // Tracks container nesting against DecodeOptions::max_depth.
            class DepthGuard {
            public:
                explicit DepthGuard(Reader& reader) : m_reader(reader) {
                    ++m_reader.m_depth;
                    if (m_reader.m_options.max_depth != 0 &&
                        m_reader.m_depth > m_reader.m_options.max_depth) {
                        throw DecodeLimitError("Nesting depth exceeds " +
                                               std::to_string(m_reader.m_options.max_depth));
                    }
                }
                ~DepthGuard() { --m_reader.m_depth; }

                DepthGuard(const DepthGuard&) = delete;
                DepthGuard& operator=(const DepthGuard&) = delete;

            private:
                Reader& m_reader;
            };

            Value read_value(uint16_t id, Type type) {
                switch (type) {
                    case Type::Struct:
                        return Value(id, type, read_struct());
                    case Type::Int16:
                    case Type::Int32:
                    case Type::Int64:
                        return Value(id, type, decode_sleb128(m_source));
                    case Type::Uint16:
                    case Type::Uint32:
                    case Type::Uint64:
                        return Value(id, type, decode_uleb128(m_source));
                    case Type::Uint8:
                        return Value(id, type, static_cast<uint64_t>(m_source.read_u8()));
                    case Type::Int8:
                        return Value(id, type, static_cast<int64_t>(static_cast<int8_t>(m_source.read_u8())));
                    case Type::Bool:
                        return Value(id, type, m_source.read_u8() != 0);
                    case Type::Float:
                        return Value(id, type, read_little_endian<float>(m_source));
                    case Type::Double:
                        return Value(id, type, read_little_endian<double>(m_source));
                    case Type::List:
                    case Type::Set:
                        return Value(id, type, read_list());
                    case Type::Map:
                        return Value(id, type, read_map());
                    case Type::String:
                        return Value(id, type, read_string());
                    case Type::Wstring:
                        return Value(id, type, read_wstring());
                    case Type::Stop:
                    case Type::StopBase:
                    case Type::Unavailable:
                        return Value(id, type);
                }
                throw UnrecognizedTypeTagError(static_cast<uint8_t>(type));
            }

            Sequence read_list() {
                DepthGuard guard(*this);
                ContainerHeader header = read_type_and_count(m_source);

                Sequence elements;
                if (header.element_type == Type::List || header.element_type == Type::Int8 ||
                    header.element_type == Type::Uint8) {
                    skip_blob(header.count);
                    return elements;
                }

                if (occupies_no_bytes(header.element_type)) {
                    check_empty_element_count(header.count);
                }
                elements.reserve(static_cast<size_t>(
                    std::min<uint64_t>(header.count, config::max_reserve_elements)));
                for (uint64_t i = 0; i < header.count; ++i) {
                    elements.push_back(read_value(0, header.element_type));
                }
                return elements;
            }

            Map read_map() {
                DepthGuard guard(*this);
                Type key_type = type_from_wire(m_source.read_u8());
                Type value_type = type_from_wire(m_source.read_u8());
                uint64_t count = decode_uleb128(m_source);
                if (occupies_no_bytes(key_type) && occupies_no_bytes(value_type)) {
                    check_empty_element_count(count);
                }

                Map entries;
                for (uint64_t i = 0; i < count; ++i) {
                    Value key = read_value(0, key_type);
                    Value value = read_value(0, value_type);
                    entries.insert_or_assign(std::move(key), std::move(value));
                }
                return entries;
            }

            // Elements without payload bytes are never bounded by the input size.
            void check_empty_element_count(uint64_t count) {
                if (m_options.max_empty_elements != 0 && count > m_options.max_empty_elements) {
                    throw DecodeLimitError("Container declares " + std::to_string(count) +
                                           " empty element(s), limit is " +
                                           std::to_string(m_options.max_empty_elements));
                }
            }

            // Raw byte and nested list payloads are stepped over, not decoded.
            void skip_blob(uint64_t count) {
                size_t offset = m_source.position();
                m_source.skip(static_cast<size_t>(count));
                log_if_enabled(LogLevel::Debug, "Skipped blob.", "SkipBlob",
                               std::chrono::microseconds(0), offset, std::to_string(count));
                with_metrics([&](IMetrics& m) { return m.increment_blob_skips(static_cast<size_t>(count)); });
            }

            std::string read_string() {
                uint64_t length = decode_uleb128(m_source);
                std::string text = read_bytes_as_string(length);
                if (!utils::is_valid_utf8(text)) {
                    if (m_options.string_errors == StringErrorPolicy::Substitute) {
                        substituted("String");
                        return {};
                    }
                    throw StringDecodeError("Invalid UTF-8 in string field");
                }
                return text;
            }

            std::string read_wstring() {
                uint64_t length = decode_uleb128(m_source);
                // 2 * length overflows past 2^63 code units; no source holds
                // that many bytes, so read until it runs dry.
                uint64_t bytes = length > std::numeric_limits<uint64_t>::max() / 2
                                     ? std::numeric_limits<uint64_t>::max()
                                     : length * 2;
                std::string raw = read_bytes_as_string(bytes);
                auto text = utils::utf16_to_utf8(std::span<const std::byte>(
                    reinterpret_cast<const std::byte*>(raw.data()), raw.size()));
                if (!text) {
                    if (m_options.string_errors == StringErrorPolicy::Substitute) {
                        substituted("Wstring");
                        return {};
                    }
                    throw WideStringDecodeError("Invalid UTF-16 in wstring field");
                }
                return std::move(*text);
            }

            // Reads in bounded chunks so a bogus length fails on the source
            // before a huge allocation happens.
            std::string read_bytes_as_string(uint64_t length) {
                constexpr size_t chunk = 64 * 1024;
                std::string out;
                while (out.size() < length) {
                    size_t n = static_cast<size_t>(std::min<uint64_t>(length - out.size(), chunk));
                    size_t at = out.size();
                    out.resize(at + n);
                    m_source.read(reinterpret_cast<std::byte*>(out.data() + at), n);
                }
                return out;
            }

            void substituted(std::string_view type) {
                log_if_enabled(LogLevel::Warn, "Undecodable text replaced with an empty string.",
                               "ReadString", std::chrono::microseconds(0), m_source.position(), type);
            }

            ByteSource& m_source;
            const DecodeOptions& m_options;
            size_t m_depth;
        };

    } // namespace

    Value decode_base_struct(ByteSource& source, const DecodeOptions& options) {
        auto start = std::chrono::steady_clock::now();
        size_t offset = source.position();
        log_if_enabled(LogLevel::Debug, "decode_base_struct called.", "DecodeBaseStruct",
                       std::chrono::microseconds(0), offset);

        try {
            Reader reader(source, options);
            Value root(0, Type::Struct, reader.read_struct());

            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);
            size_t consumed = source.position() - offset;
            log_if_enabled(LogLevel::Info, "Decoded base struct.", "DecodeBaseStruct", elapsed,
                           source.position(), std::to_string(consumed));
            with_metrics([&](IMetrics& m) {
                bool ok = m.record_latency("DecodeBaseStruct", elapsed.count() / 1e6);
                ok = m.record_bytes_read(consumed) && ok;
                return m.increment_operation_count("DecodeBaseStruct", "ok") && ok;
            });
            return root;
        } catch (const exception& e) {
            auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::steady_clock::now() - start);
            log_if_enabled(LogLevel::Error, e.what(), "DecodeBaseStruct", elapsed,
                           source.position(), e.kind());
            with_metrics([&](IMetrics& m) {
                bool ok = m.record_error(e.kind());
                return m.increment_operation_count("DecodeBaseStruct", "error") && ok;
            });
            throw;
        }
    }

    Value decode_base_struct(std::span<const std::byte> data, const DecodeOptions& options) {
        MemorySource source(data);
        return decode_base_struct(source, options);
    }

    Value decode_base_struct(std::istream& in, const DecodeOptions& options) {
        StreamSource source(in);
        return decode_base_struct(source, options);
    }

} // namespace bondcpp
