#include <pngchunk/chunk.hh>
#include <pngchunk/crc.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <cstring>
#include <ostream>
#include <sstream>
#include <utility>

#include "utf8.hh"

namespace pngchunk {

    chunk::chunk(chunk_type type, std::vector<std::uint8_t> data)
        : m_length(0)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(0) {
        THROW_PNGCHUNK_IF(m_data.size() > max_payload_size, payload_too_large, m_data.size(), max_payload_size);
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = crc32(m_type, m_data.data(), m_data.size());
    }

    chunk::chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc)
        : m_length(length)
        , m_type(type)
        , m_data(std::move(data))
        , m_crc(crc) {
    }

    chunk chunk::from_text(chunk_type type, std::string_view text) {
        return {type, std::vector<std::uint8_t>(text.begin(), text.end())};
    }

    decoded_chunk chunk::decode_prefix(const std::uint8_t* bytes, std::size_t size) {
        return decode_prefix(bytes, size, decode_options{});
    }

    decoded_chunk chunk::decode_prefix(const std::uint8_t* bytes, std::size_t size, const decode_options& options) {
        THROW_PNGCHUNK_IF(size < min_encoded_size, too_short, size, min_encoded_size);
        THROW_PNGCHUNK_UNLESS(bytes, parse_error, "Null buffer in chunk::decode");

        const std::uint32_t length = load_be32(bytes);

        chunk_type::bytes_type raw;
        std::memcpy(raw.data(), bytes + length_size, type_size);
        THROW_PNGCHUNK_UNLESS(chunk_type::is_valid_bytes(raw), invalid_chunk_type, raw);
        const chunk_type type(raw);

        if (!type.is_reserved_bit_valid()) {
            THROW_PNGCHUNK_IF(options.reject_nonconforming, invalid_chunk_type, raw,
                              "reserved bit (case of the third letter) must be uppercase");
            if (options.on_warning) {
                options.on_warning(length_size, "reserved_bit",
                    build_error_msg("Chunk type ", type, " has a lowercase third letter, reserved bit is not valid"));
            }
        }

        THROW_PNGCHUNK_IF(length > options.max_payload_size, payload_too_large, length, options.max_payload_size);

        // 64-bit arithmetic, a length near 2^32 must not wrap
        const std::uint64_t required = std::uint64_t(min_encoded_size) + length;
        THROW_PNGCHUNK_IF(size < required, truncated, required, size);

        const std::uint8_t* payload = bytes + header_size;
        const std::uint32_t stored = load_be32(payload + length);
        const std::uint32_t computed = crc32(type, payload, length);
        THROW_PNGCHUNK_IF(stored != computed, checksum_mismatch, stored, computed);

        return decoded_chunk{
            chunk(length, type, std::vector<std::uint8_t>(payload, payload + length), stored),
            static_cast<std::size_t>(required)
        };
    }

    chunk chunk::decode(const std::uint8_t* bytes, std::size_t size) {
        return decode(bytes, size, decode_options{});
    }

    chunk chunk::decode(const std::uint8_t* bytes, std::size_t size, const decode_options& options) {
        auto result = decode_prefix(bytes, size, options);

        if (result.consumed < size && options.on_warning) {
            options.on_warning(result.consumed, "trailing_data",
                build_error_msg(size - result.consumed, " bytes after chunk ", result.value.type(), " ignored"));
        }

        return std::move(result.value);
    }

    chunk chunk::decode(const std::vector<std::uint8_t>& bytes, const decode_options& options) {
        return decode(bytes.data(), bytes.size(), options);
    }

    chunk chunk::decode(const std::vector<std::uint8_t>& bytes) {
        return decode(bytes.data(), bytes.size(), decode_options{});
    }

    std::string chunk::data_as_string() const {
        auto bad = find_invalid_utf8(m_data.data(), m_data.size());
        THROW_PNGCHUNK_IF(bad.has_value(), not_utf8, *bad);
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::uint8_t> chunk::to_bytes() const {
        std::vector<std::uint8_t> out;
        out.reserve(encoded_size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::uint8_t>& out) const {
        const std::size_t start = out.size();
        out.resize(start + encoded_size());

        std::uint8_t* dst = out.data() + start;
        store_be32(m_length, dst);
        std::memcpy(dst + length_size, m_type.bytes().data(), type_size);
        if (!m_data.empty()) {
            std::memcpy(dst + header_size, m_data.data(), m_data.size());
        }
        store_be32(m_crc, dst + header_size + m_data.size());
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    bool chunk::operator==(const chunk& o) const {
        return m_length == o.m_length && m_type == o.m_type &&
               m_crc == o.m_crc && m_data == o.m_data;
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        os << "Chunk {\n"
           << "  Length: " << c.length() << "\n"
           << "  Type: " << c.type().to_string() << "\n"
           << "  Data: " << c.data().size() << " bytes\n"
           << "  Crc: " << c.crc() << "\n"
           << "}\n";
        return os;
    }

} // namespace pngchunk
