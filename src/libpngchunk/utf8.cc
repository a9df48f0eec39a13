#include "utf8.hh"

namespace pngchunk {

    std::optional<std::size_t> find_invalid_utf8(const std::uint8_t* data, std::size_t size) {
        std::size_t i = 0;
        while (i < size) {
            const std::uint8_t lead = data[i];
            if (lead < 0x80) {
                ++i;
                continue;
            }

            // Sequence length and allowed range of the second byte
            std::size_t len;
            std::uint8_t lo = 0x80;
            std::uint8_t hi = 0xBF;
            if (lead >= 0xC2 && lead <= 0xDF) {
                len = 2;
            } else if (lead >= 0xE0 && lead <= 0xEF) {
                len = 3;
                if (lead == 0xE0) {
                    lo = 0xA0;      // overlong
                } else if (lead == 0xED) {
                    hi = 0x9F;      // surrogates
                }
            } else if (lead >= 0xF0 && lead <= 0xF4) {
                len = 4;
                if (lead == 0xF0) {
                    lo = 0x90;      // overlong
                } else if (lead == 0xF4) {
                    hi = 0x8F;      // above U+10FFFF
                }
            } else {
                return i;
            }

            if (size - i < len) {
                return i;
            }
            if (data[i + 1] < lo || data[i + 1] > hi) {
                return i;
            }
            for (std::size_t k = 2; k < len; ++k) {
                if ((data[i + k] & 0xC0) != 0x80) {
                    return i;
                }
            }
            i += len;
        }
        return std::nullopt;
    }

} // namespace pngchunk
