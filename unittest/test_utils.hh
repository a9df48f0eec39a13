#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

// Payload used by the secret message scenarios
inline constexpr std::string_view secret_message = "This is where your secret message will be!";

// CRC-32 of "RuSt" followed by secret_message
inline constexpr std::uint32_t secret_message_crc = 2882656334u;

inline void append_be32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 24));
    out.push_back(static_cast<std::uint8_t>(value >> 16));
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value));
}

// Serialized chunk assembled by hand, fields are taken as given
inline std::vector<std::uint8_t> make_raw_chunk(std::uint32_t length, std::string_view type,
                                                std::string_view payload, std::uint32_t crc) {
    std::vector<std::uint8_t> out;
    append_be32(out, length);
    out.insert(out.end(), type.begin(), type.end());
    out.insert(out.end(), payload.begin(), payload.end());
    append_be32(out, crc);
    return out;
}

inline std::vector<std::uint8_t> make_secret_chunk() {
    return make_raw_chunk(static_cast<std::uint32_t>(secret_message.size()), "RuSt",
                          secret_message, secret_message_crc);
}
