#include "TextCodec.hpp"

#include <array>
#include <unordered_map>

namespace savescan
{
namespace
{
const std::array<std::string_view, 256>& DecodeTable()
{
    static const std::array<std::string_view, 256> table = []
    {
        std::array<std::string_view, 256> t{};
        t[0x00] = " ";

        static constexpr std::string_view kDigits[] = { "0", "1", "2", "3", "4", "5", "6", "7", "8", "9" };
        for (int i = 0; i < 10; ++i)
            t[0xA1 + i] = kDigits[i];

        t[0xAB] = "!";
        t[0xAC] = "?";
        t[0xAD] = ".";
        t[0xAE] = "-";
        t[0xB0] = "…";
        t[0xB1] = "“";
        t[0xB2] = "”";
        t[0xB3] = "‘";
        t[0xB4] = "’";
        t[0xB5] = "♂";
        t[0xB6] = "♀";
        t[0xB8] = ",";
        t[0xBA] = "/";

        static constexpr std::string_view kUpper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        static constexpr std::string_view kLower = "abcdefghijklmnopqrstuvwxyz";
        for (size_t i = 0; i < 26; ++i)
        {
            t[0xBB + i] = kUpper.substr(i, 1);
            t[0xD5 + i] = kLower.substr(i, 1);
        }
        return t;
    }();
    return table;
}

const std::unordered_map<std::string_view, uint8_t>& EncodeTable()
{
    static const std::unordered_map<std::string_view, uint8_t> table = []
    {
        std::unordered_map<std::string_view, uint8_t> t;
        const auto& decode = DecodeTable();
        for (size_t code = 0; code < decode.size(); ++code)
        {
            if (!decode[code].empty())
                t.emplace(decode[code], static_cast<uint8_t>(code));
        }
        return t;
    }();
    return table;
}

size_t Utf8SequenceLength(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 0;
}
} // namespace

std::string_view TextCodec::DecodeChar(uint8_t code) { return DecodeTable()[code]; }

std::string TextCodec::Decode(const uint8_t* data, size_t size)
{
    std::string out;
    if (data == nullptr)
        return out;

    size_t end = size;
    for (size_t i = 0; i < size; ++i)
    {
        if (data[i] == kTerminator)
        {
            end = i;
            break;
        }
    }

    // Trailing zero run with no terminator is an empty slot, not spaces
    if (end == size)
    {
        while (end > 0 && data[end - 1] == kSpace)
            --end;
    }

    for (size_t i = 0; i < end; ++i)
        out.append(DecodeChar(data[i]));

    return out;
}

std::optional<std::vector<uint8_t>> TextCodec::Encode(std::string_view text)
{
    const auto& table = EncodeTable();
    std::vector<uint8_t> out;
    out.reserve(text.size() + 1);

    size_t i = 0;
    while (i < text.size())
    {
        size_t length = Utf8SequenceLength(static_cast<unsigned char>(text[i]));
        if (length == 0 || i + length > text.size())
            return std::nullopt;

        auto it = table.find(text.substr(i, length));
        if (it == table.end())
            return std::nullopt;

        out.push_back(it->second);
        i += length;
    }

    out.push_back(kTerminator);
    return out;
}

std::vector<std::string> TextCodec::Alphabet()
{
    std::vector<std::string> out;
    for (const auto& entry : DecodeTable())
    {
        if (!entry.empty())
            out.emplace_back(entry);
    }
    return out;
}

} // namespace savescan
