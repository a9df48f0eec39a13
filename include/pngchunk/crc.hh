/**
 * @file crc.hh
 * @brief CRC-32 as prescribed by the PNG specification
 *
 * CRC-32/ISO-HDLC: reflected polynomial 0xEDB88320, initial value and
 * final xor 0xFFFFFFFF. The chunk CRC covers the type bytes followed by
 * the payload, never the length field.
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    class chunk_type;

    /**
     * @brief CRC-32 of a byte range
     * @param data Bytes to checksum (may be null when size is 0)
     * @param size Number of bytes
     * @return Finalized CRC-32
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const std::uint8_t* data, std::size_t size);

    /**
     * @brief Continue a CRC-32 over more bytes
     * @param crc Finalized CRC of the preceding bytes (0 for none)
     * @param data Bytes to append
     * @param size Number of bytes
     * @return Finalized CRC-32 of the preceding bytes followed by data
     */
    PNGCHUNK_EXPORT std::uint32_t crc32_update(std::uint32_t crc, const std::uint8_t* data, std::size_t size);

    /**
     * @brief CRC-32 of a chunk, computed over type bytes then payload
     */
    PNGCHUNK_EXPORT std::uint32_t crc32(const chunk_type& type, const std::uint8_t* data, std::size_t size);

} // namespace pngchunk
