/**
 * @file ModifiedUtf8.hpp
 * @brief Internal codec for the modified UTF-8 string payload.
 *
 * Modified UTF-8 differs from standard UTF-8 in two ways: U+0000 is
 * written as the overlong pair 0xC0 0x80, and characters outside the
 * BMP are written as a surrogate pair of two 3-byte sequences. Only
 * 1, 2 and 3 byte sequences exist, so every sequence maps to exactly
 * one UTF-16 code unit.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace javaio
{
namespace utf
{
    /**
     * @brief Decodes a modified UTF-8 payload into UTF-16 code units.
     *
     * Surrogates are passed through one by one without pairing checks.
     *
     * @param payload The raw payload bytes (length prefix already removed).
     * @return The decoded code units, in order.
     * @throws javaio::EndOfInput if a sequence is cut off by the end of
     * the payload.
     * @throws javaio::InvalidData on a bad lead or continuation byte.
     */
    std::u16string decodeModifiedUtf8(std::span<const uint8_t> payload);

    /**
     * @brief Converts UTF-16 code units to a UTF-8 string.
     * @throws javaio::InvalidData on an unpaired or misordered surrogate.
     */
    std::string utf16ToUtf8(const std::u16string& units);

} // namespace utf
} // namespace javaio
