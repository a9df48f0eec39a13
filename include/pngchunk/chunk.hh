/**
 * @file chunk.hh
 * @brief PNG chunk value and its wire codec
 *
 * Wire layout of a chunk:
 *
 * | offset  | size | field                                 |
 * |---------|------|---------------------------------------|
 * | 0       | 4    | length, big-endian, payload byte count|
 * | 4       | 4    | chunk type, 4 ASCII letters           |
 * | 8       | len  | payload                               |
 * | 8 + len | 4    | CRC-32 of type and payload, big-endian|
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/decode_options.hh>

namespace pngchunk {

    struct decoded_chunk;

    /**
     * @class chunk
     * @brief A validated chunk: length, type, payload and CRC
     *
     * A chunk is obtained either from a type and a payload, with length and
     * CRC computed, or by decoding bytes, with the CRC verified. In both
     * cases length equals the payload size and the CRC matches the type
     * and payload. Instances are not modified after construction.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        static constexpr std::size_t length_size = 4;
        static constexpr std::size_t type_size = 4;
        static constexpr std::size_t crc_size = 4;
        static constexpr std::size_t header_size = length_size + type_size;
        static constexpr std::size_t min_encoded_size = header_size + crc_size;
        static constexpr std::uint64_t max_payload_size = 0xFFFFFFFFu;

        /**
         * @brief Build a chunk from a type and a payload
         * @param type Chunk type
         * @param data Payload, taken over by the chunk
         * @throws payload_too_large if data does not fit the 32-bit length field
         */
        chunk(chunk_type type, std::vector<std::uint8_t> data);

        /**
         * @brief Build a chunk whose payload is the bytes of text
         */
        static chunk from_text(chunk_type type, std::string_view text);

        /**
         * @brief Decode one chunk occupying a whole buffer
         * @param bytes Start of the serialized chunk
         * @param size Number of bytes available
         * @param options Limits and warning handler
         * @return Decoded chunk
         * @throws too_short, truncated, checksum_mismatch, invalid_chunk_type, payload_too_large
         *
         * Bytes after the chunk are ignored and reported as a
         * "trailing_data" warning.
         */
        static chunk decode(const std::uint8_t* bytes, std::size_t size, const decode_options& options);
        static chunk decode(const std::uint8_t* bytes, std::size_t size);
        static chunk decode(const std::vector<std::uint8_t>& bytes, const decode_options& options);
        static chunk decode(const std::vector<std::uint8_t>& bytes);

        /**
         * @brief Decode the chunk at the start of a larger buffer
         * @return Decoded chunk and the number of bytes it occupies
         */
        static decoded_chunk decode_prefix(const std::uint8_t* bytes, std::size_t size, const decode_options& options);
        static decoded_chunk decode_prefix(const std::uint8_t* bytes, std::size_t size);

        [[nodiscard]] std::uint32_t length() const { return m_length; }
        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::uint8_t>& data() const { return m_data; }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        // Size of the serialized form
        [[nodiscard]] std::size_t encoded_size() const { return min_encoded_size + m_data.size(); }

        /**
         * @brief Payload as text
         * @throws not_utf8 if the payload is not well-formed UTF-8
         */
        [[nodiscard]] std::string data_as_string() const;

        /**
         * @brief Serialize: length, type, payload, CRC
         */
        [[nodiscard]] std::vector<std::uint8_t> to_bytes() const;

        /**
         * @brief Append the serialized form to out
         */
        void write_to(std::vector<std::uint8_t>& out) const;

        // Multi-line summary for diagnostics
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const;
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(std::uint32_t length, chunk_type type, std::vector<std::uint8_t> data, std::uint32_t crc);

        std::uint32_t m_length;
        chunk_type m_type;
        std::vector<std::uint8_t> m_data;
        std::uint32_t m_crc;
    };

    /**
     * @struct decoded_chunk
     * @brief Result of decode_prefix
     */
    struct decoded_chunk {
        chunk value;
        std::size_t consumed;   ///< Bytes occupied by the chunk in the input
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
