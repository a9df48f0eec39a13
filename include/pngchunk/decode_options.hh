/**
 * @file decode_options.hh
 * @brief Options controlling how raw bytes are decoded into chunks
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct decode_options
     * @brief Configuration options for decoding a chunk
     *
     * Controls size limits, conformance strictness and warning handling.
     * The defaults accept every chunk the wire format can express.
     */
    struct decode_options {
        /**
         * @brief Maximum allowed payload size in bytes
         *
         * A declared length above this is rejected with payload_too_large
         * before any payload byte is touched. Default is the largest value
         * the 32-bit length field can hold.
         */
        std::uint64_t max_payload_size = 0xFFFFFFFFu;

        /**
         * @brief Reject chunk types whose reserved bit is not valid
         *
         * When true, a type with a lowercase third letter is rejected with
         * invalid_chunk_type. When false, it is accepted and reported
         * through on_warning.
         */
        bool reject_nonconforming = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset in the input buffer the warning refers to
         * @param category Warning category ("trailing_data", "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during decoding.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
