/**
 * @file chunk_type.hh
 * @brief Validated 4-byte PNG chunk type tag
 *
 * A chunk type is four ASCII letters. Bit 5 (0x20) of each byte, that is
 * the letter case, encodes one property of the chunk:
 *
 * | byte | uppercase          | lowercase               |
 * |------|--------------------|-------------------------|
 * | 0    | critical           | ancillary               |
 * | 1    | public             | private                 |
 * | 2    | reserved bit valid | reserved, nonconforming |
 * | 3    | unsafe to copy     | safe to copy            |
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    /**
     * @brief Bit-convention tests over raw tag bytes
     *
     * These work on any 4 bytes, validated or not, so a decoder can inspect
     * a tag before deciding whether to accept it.
     */
    namespace type_bits {
        using bytes_type = std::array<std::uint8_t, 4>;

        inline constexpr std::uint8_t case_bit = 0x20;

        constexpr bool is_ascii_alpha(std::uint8_t c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        constexpr bool is_upper(std::uint8_t c) { return (c & case_bit) == 0; }

        constexpr bool is_critical(const bytes_type& b) { return is_upper(b[0]); }
        constexpr bool is_public(const bytes_type& b) { return is_upper(b[1]); }
        constexpr bool is_reserved_bit_valid(const bytes_type& b) { return is_upper(b[2]); }
        constexpr bool is_safe_to_copy(const bytes_type& b) { return !is_upper(b[3]); }
    }

    /**
     * @class chunk_type
     * @brief Immutable chunk type tag, always made of four ASCII letters
     *
     * Every constructor validates its input and throws invalid_chunk_type
     * (or wrong_length for text of the wrong size), so an instance is
     * valid for its whole lifetime.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = type_bits::bytes_type;

        /**
         * @brief Construct from 4 raw bytes
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        constexpr explicit chunk_type(const bytes_type& bytes)
            : m_bytes(bytes) {
            if (!is_valid_bytes(bytes)) {
                throw invalid_chunk_type(bytes);
            }
        }

        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : chunk_type(bytes_type{
                  static_cast<std::uint8_t>(c0), static_cast<std::uint8_t>(c1),
                  static_cast<std::uint8_t>(c2), static_cast<std::uint8_t>(c3)}) {}

        /**
         * @brief Construct from 4 bytes at the given address
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        static chunk_type from_bytes(const void* data) {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        /**
         * @brief Construct from text
         * @param text Exactly 4 bytes of text (byte count, not characters)
         * @throws wrong_length if text is not 4 bytes long
         * @throws invalid_chunk_type if any byte is not an ASCII letter
         */
        static chunk_type from_string(std::string_view text);

        /**
         * @brief Check that all 4 bytes are ASCII letters
         */
        static constexpr bool is_valid_bytes(const bytes_type& bytes) {
            return type_bits::is_ascii_alpha(bytes[0]) && type_bits::is_ascii_alpha(bytes[1]) &&
                   type_bits::is_ascii_alpha(bytes[2]) && type_bits::is_ascii_alpha(bytes[3]);
        }

        [[nodiscard]] constexpr const bytes_type& bytes() const { return m_bytes; }

        [[nodiscard]] constexpr bool is_critical() const { return type_bits::is_critical(m_bytes); }
        [[nodiscard]] constexpr bool is_ancillary() const { return !is_critical(); }
        [[nodiscard]] constexpr bool is_public() const { return type_bits::is_public(m_bytes); }
        [[nodiscard]] constexpr bool is_private() const { return !is_public(); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return type_bits::is_reserved_bit_valid(m_bytes); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return type_bits::is_safe_to_copy(m_bytes); }

        /**
         * @brief Conformance check against the current PNG convention
         *
         * A type conforms when its reserved bit is valid (third byte
         * uppercase) and its fourth byte is a letter.
         */
        [[nodiscard]] constexpr bool is_valid() const {
            return is_reserved_bit_valid() && type_bits::is_ascii_alpha(m_bytes[3]);
        }

        // Text form, for display and for matching known names
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t result;
            std::memcpy(&result, m_bytes.data(), 4);
            return result;
        }

        constexpr std::uint8_t operator[](std::size_t i) const { return m_bytes[i]; }

        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }

    private:
        bytes_type m_bytes;
    };

    // Quoted output, e.g. 'IHDR'
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // User-defined literal for compile-time validated chunk types
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw wrong_length(4, len);
        }
        return {str[0], str[1], str[2], str[3]};
    }

    /**
     * @brief Chunk types from the PNG registry
     */
    namespace known_types {
        inline constexpr chunk_type IHDR = "IHDR"_ct;
        inline constexpr chunk_type PLTE = "PLTE"_ct;
        inline constexpr chunk_type IDAT = "IDAT"_ct;
        inline constexpr chunk_type IEND = "IEND"_ct;
        inline constexpr chunk_type tRNS = "tRNS"_ct;
        inline constexpr chunk_type gAMA = "gAMA"_ct;
        inline constexpr chunk_type cHRM = "cHRM"_ct;
        inline constexpr chunk_type sRGB = "sRGB"_ct;
        inline constexpr chunk_type iCCP = "iCCP"_ct;
        inline constexpr chunk_type tEXt = "tEXt"_ct;
        inline constexpr chunk_type zTXt = "zTXt"_ct;
        inline constexpr chunk_type iTXt = "iTXt"_ct;
        inline constexpr chunk_type bKGD = "bKGD"_ct;
        inline constexpr chunk_type pHYs = "pHYs"_ct;
        inline constexpr chunk_type tIME = "tIME"_ct;
    }

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            return (static_cast<std::size_t>(t.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
