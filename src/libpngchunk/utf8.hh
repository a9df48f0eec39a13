#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

namespace pngchunk {

    // Offset of the first byte that does not start a well-formed UTF-8
    // sequence (RFC 3629: no overlong forms, no surrogates, nothing above
    // U+10FFFF), or nullopt when the whole range is valid.
    std::optional<std::size_t> find_invalid_utf8(const std::uint8_t* data, std::size_t size);

} // namespace pngchunk
