/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk codec
 *
 * Every failure of the codec is reported by throwing one of the classes
 * below. Each exception keeps the values that caused it, so callers can
 * react on the cause without parsing the message.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pngchunk {

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Arguments are streamed in order, so stream manipulators such as
     * std::hex may be passed between values.
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @class pngchunk_error
     * @brief Base exception class for all codec errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every codec error with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Base class for failures of the decode path
     *
     * Thrown when a byte buffer does not hold a well-formed chunk:
     * the buffer is too small, cut short, or fails its checksum.
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class invalid_chunk_type
     * @brief A chunk type tag is made of something other than ASCII letters
     */
    class invalid_chunk_type : public pngchunk_error {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        explicit invalid_chunk_type(const bytes_type& bytes)
            : invalid_chunk_type(bytes, "every byte must be an ASCII letter") {}

        invalid_chunk_type(const bytes_type& bytes, const std::string& reason)
            : pngchunk_error(build_error_msg(
                  "Invalid chunk type [", static_cast<unsigned>(bytes[0]), ' ',
                  static_cast<unsigned>(bytes[1]), ' ', static_cast<unsigned>(bytes[2]), ' ',
                  static_cast<unsigned>(bytes[3]), "]: ", reason))
            , m_bytes(bytes) {}

        [[nodiscard]] const bytes_type& bytes() const noexcept { return m_bytes; }

    private:
        bytes_type m_bytes;
    };

    /**
     * @class wrong_length
     * @brief A chunk type string does not hold exactly 4 bytes
     */
    class wrong_length : public pngchunk_error {
    public:
        wrong_length(std::size_t expected, std::size_t actual)
            : pngchunk_error(build_error_msg(
                  "Chunk type must be ", expected, " bytes long, got ", actual))
            , m_expected(expected)
            , m_actual(actual) {}

        [[nodiscard]] std::size_t expected() const noexcept { return m_expected; }
        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        std::size_t m_expected;
        std::size_t m_actual;
    };

    /**
     * @class payload_too_large
     * @brief A payload does not fit the chunk length field or a configured limit
     */
    class payload_too_large : public pngchunk_error {
    public:
        payload_too_large(std::uint64_t size, std::uint64_t maximum)
            : pngchunk_error(build_error_msg(
                  "Chunk payload of ", size, " bytes exceeds maximum allowed size of ",
                  maximum, " bytes"))
            , m_size(size)
            , m_maximum(maximum) {}

        [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }
        [[nodiscard]] std::uint64_t maximum() const noexcept { return m_maximum; }

    private:
        std::uint64_t m_size;
        std::uint64_t m_maximum;
    };

    /**
     * @class too_short
     * @brief Input is smaller than the minimal chunk envelope
     */
    class too_short : public parse_error {
    public:
        too_short(std::size_t actual, std::size_t minimum)
            : parse_error(build_error_msg(
                  "Chunk buffer of ", actual, " bytes is too short, at least ",
                  minimum, " bytes are required"))
            , m_actual(actual)
            , m_minimum(minimum) {}

        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }
        [[nodiscard]] std::size_t minimum() const noexcept { return m_minimum; }

    private:
        std::size_t m_actual;
        std::size_t m_minimum;
    };

    /**
     * @class truncated
     * @brief Declared chunk length reaches past the end of the input
     */
    class truncated : public parse_error {
    public:
        truncated(std::uint64_t required, std::uint64_t available)
            : parse_error(build_error_msg(
                  "Chunk is truncated: declared length requires ", required,
                  " bytes but only ", available, " are available"))
            , m_required(required)
            , m_available(available) {}

        [[nodiscard]] std::uint64_t required() const noexcept { return m_required; }
        [[nodiscard]] std::uint64_t available() const noexcept { return m_available; }

    private:
        std::uint64_t m_required;
        std::uint64_t m_available;
    };

    /**
     * @class checksum_mismatch
     * @brief Stored CRC does not match the CRC of the type and payload
     */
    class checksum_mismatch : public parse_error {
    public:
        checksum_mismatch(std::uint32_t stored, std::uint32_t computed)
            : parse_error(build_error_msg(
                  "Chunk CRC mismatch: stored 0x", std::hex, stored,
                  ", computed 0x", computed))
            , m_stored(stored)
            , m_computed(computed) {}

        [[nodiscard]] std::uint32_t stored() const noexcept { return m_stored; }
        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }

    private:
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @class not_utf8
     * @brief Payload was requested as text but is not well-formed UTF-8
     */
    class not_utf8 : public pngchunk_error {
    public:
        explicit not_utf8(std::size_t offset)
            : pngchunk_error(build_error_msg(
                  "Chunk payload is not valid UTF-8: invalid sequence at offset ", offset))
            , m_offset(offset) {}

        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_PNGCHUNK_IF
     * @brief Throw an exception of the given type if condition holds
     * @param condition Condition to check
     * @param type Exception class to throw
     * @param ... Constructor arguments of the exception
     */
    #define THROW_PNGCHUNK_IF(condition, type, ...) \
        do { if (condition) throw type(__VA_ARGS__); } while(0)

    /**
     * @def THROW_PNGCHUNK_UNLESS
     * @brief Throw an exception of the given type unless condition holds
     * @param condition Condition that must be true to avoid throwing
     * @param type Exception class to throw
     * @param ... Constructor arguments of the exception
     */
    #define THROW_PNGCHUNK_UNLESS(condition, type, ...) \
        do { if (!(condition)) throw type(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
