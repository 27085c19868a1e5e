/**
 * @file ModifiedUtf8.cpp
 * @brief Implementation of the modified UTF-8 codec.
 */

#include "ModifiedUtf8.hpp"
#include "javaio/Errors.hpp"
#include <cstddef>

namespace javaio
{
namespace utf
{

namespace
{
    std::string hexByte(uint8_t b)
    {
        static constexpr char digits[] = "0123456789ABCDEF";
        std::string s = "0x";
        s += digits[b >> 4];
        s += digits[b & 0x0F];
        return s;
    }

    /**
     * @brief Reads the continuation byte at @p pos and returns its low 6 bits.
     */
    uint16_t continuation(std::span<const uint8_t> payload, size_t pos)
    {
        if (pos >= payload.size())
        {
            throw EndOfInput("modified UTF-8 continuation byte");
        }

        uint8_t b = payload[pos];
        // 10xx_xxxx
        if ((b >> 6) != 0b10)
        {
            throw InvalidData("continuation byte " + hexByte(b) +
                              " at offset " + std::to_string(pos));
        }
        return static_cast<uint16_t>(b & 0x3F);
    }

    void appendUtf8(std::string& out, uint32_t codepoint)
    {
        if (codepoint <= 0x7F)
        {
            out += static_cast<char>(codepoint);
        }
        else if (codepoint <= 0x7FF)
        {
            out += static_cast<char>(0xC0 | (codepoint >> 6));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        else if (codepoint <= 0xFFFF)
        {
            out += static_cast<char>(0xE0 | (codepoint >> 12));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (codepoint >> 18));
            out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (codepoint & 0x3F));
        }
    }
}

std::u16string decodeModifiedUtf8(std::span<const uint8_t> payload)
{
    std::u16string units;
    units.reserve(payload.size());

    size_t pos = 0;
    while (pos < payload.size())
    {
        uint8_t b0 = payload[pos];

        if ((b0 >> 7) == 0)
        {
            // 0xxx_xxxx
            units.push_back(static_cast<char16_t>(b0 & 0x7F));
            pos += 1;
        }
        else if ((b0 >> 5) == 0b110)
        {
            // 110x_xxxx 10xx_xxxx (also covers the 0xC0 0x80 null)
            uint16_t hi = static_cast<uint16_t>(b0 & 0x1F);
            uint16_t b1 = continuation(payload, pos + 1);
            units.push_back(static_cast<char16_t>((hi << 6) | b1));
            pos += 2;
        }
        else if ((b0 >> 4) == 0b1110)
        {
            // 1110_xxxx 10xx_xxxx 10xx_xxxx
            uint16_t hi = static_cast<uint16_t>(b0 & 0x0F);
            uint16_t b1 = continuation(payload, pos + 1);
            uint16_t b2 = continuation(payload, pos + 2);
            units.push_back(static_cast<char16_t>((hi << 12) | (b1 << 6) | b2));
            pos += 3;
        }
        else
        {
            throw InvalidData("lead byte " + hexByte(b0) +
                              " at offset " + std::to_string(pos));
        }
    }

    return units;
}

std::string utf16ToUtf8(const std::u16string& units)
{
    std::string out;
    out.reserve(units.size());

    for (size_t i = 0; i < units.size(); ++i)
    {
        uint32_t u1 = units[i];

        if (u1 >= 0xD800 && u1 <= 0xDBFF)
        {
            // High surrogate, must be followed by a low one
            if (i + 1 >= units.size())
            {
                throw InvalidData("unpaired high surrogate at code unit " +
                                  std::to_string(i));
            }
            uint32_t u2 = units[i + 1];
            if (u2 < 0xDC00 || u2 > 0xDFFF)
            {
                throw InvalidData("unpaired high surrogate at code unit " +
                                  std::to_string(i));
            }
            appendUtf8(out, 0x10000 + ((u1 - 0xD800) << 10) + (u2 - 0xDC00));
            ++i;
        }
        else if (u1 >= 0xDC00 && u1 <= 0xDFFF)
        {
            throw InvalidData("unpaired low surrogate at code unit " +
                              std::to_string(i));
        }
        else
        {
            appendUtf8(out, u1);
        }
    }

    return out;
}

} // namespace utf
} // namespace javaio
