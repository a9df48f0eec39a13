#include <pngchunk/crc.hh>
#include <pngchunk/chunk_type.hh>

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    std::uint32_t crc32_update(std::uint32_t crc, const std::uint8_t* data, std::size_t size) {
        uLong value = crc;
        // zlib takes a 32-bit length, feed larger ranges in pieces
        while (size > 0) {
            auto piece = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            value = ::crc32(value, data, piece);
            data += piece;
            size -= piece;
        }
        return static_cast<std::uint32_t>(value);
    }

    std::uint32_t crc32(const std::uint8_t* data, std::size_t size) {
        return crc32_update(0, data, size);
    }

    std::uint32_t crc32(const chunk_type& type, const std::uint8_t* data, std::size_t size) {
        std::uint32_t crc = crc32_update(0, type.bytes().data(), type.bytes().size());
        return crc32_update(crc, data, size);
    }

} // namespace pngchunk
