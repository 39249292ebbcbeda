#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace savescan
{

/**
 * @brief Generation III single-byte character encoding
 *
 * Decoding stops at the terminator (0xFF) or at a blank slot: a run of
 * 0x00 bytes that reaches the end of the field with no terminator. A 0x00
 * followed by more text is an ordinary space, so {A, B, 0x00, C} decodes
 * to "AB C" where readers that stop at the first 0x00 would give "AB".
 * Unmapped bytes decode to nothing. Text is UTF-8 on the host side.
 */
class TextCodec
{
public:
    static constexpr uint8_t kTerminator = 0xFF;
    static constexpr uint8_t kSpace = 0x00;
    static constexpr uint8_t kFirstLetter = 0xBB; // 'A'
    static constexpr uint8_t kLastLetter = 0xEE;  // 'z'

    static std::string Decode(const uint8_t* data, size_t size);
    static std::string Decode(const std::vector<uint8_t>& bytes) { return Decode(bytes.data(), bytes.size()); }

    /**
     * @brief Encode UTF-8 text, appending the terminator
     * @return std::nullopt if the text contains an unsupported character
     */
    static std::optional<std::vector<uint8_t>> Encode(std::string_view text);

    /// UTF-8 text for one code, empty if unmapped
    static std::string_view DecodeChar(uint8_t code);

    /// Player-entered names start with a letter
    static bool IsValidFirstCharacter(uint8_t code) { return code >= kFirstLetter && code <= kLastLetter; }

    /// Every character Encode() accepts, one UTF-8 string each
    static std::vector<std::string> Alphabet();
};

} // namespace savescan
