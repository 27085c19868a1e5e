/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * This file provides a single source of truth for the low-level
 * byte conversion logic: platform-independent big-endian reading
 * and bit-exact reinterpretation of IEEE-754 patterns.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring> // For std::memcpy
#include <type_traits>

namespace javaio
{
namespace utils
{
    /**
     * @brief Reads a 16-bit big-endian unsigned short from a byte buffer.
     * @param b A pointer to at least 2 bytes of data.
     * @return The platform-native uint16_t.
     */
    inline uint16_t readBeUShort(const uint8_t* b)
    {
        return static_cast<uint16_t>(
            (static_cast<uint16_t>(b[0]) << 8) |
            static_cast<uint16_t>(b[1])
        );
    }

    /**
     * @brief Reads a 32-bit big-endian unsigned integer from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     * @return The platform-native uint32_t.
     */
    inline uint32_t readBeUInt(const uint8_t* b)
    {
        return (static_cast<uint32_t>(b[0]) << 24) |
               (static_cast<uint32_t>(b[1]) << 16) |
               (static_cast<uint32_t>(b[2]) << 8) |
               static_cast<uint32_t>(b[3]);
    }

    /**
     * @brief Reads a 64-bit big-endian unsigned long from a byte buffer.
     * @param b A pointer to at least 8 bytes of data.
     * @return The platform-native uint64_t.
     */
    inline uint64_t readBeULong(const uint8_t* b)
    {
        return (static_cast<uint64_t>(readBeUInt(b)) << 32) |
               static_cast<uint64_t>(readBeUInt(b + 4));
    }

    /**
     * @brief Reinterprets the bits of @p from as a value of type To.
     */
    template <typename To, typename From>
    inline To bitCast(From from)
    {
        static_assert(sizeof(To) == sizeof(From));
        To result;
        std::memcpy(&result, &from, sizeof(from));
        return result;
    }

    /**
     * @brief Reads a big-endian value of type T from a byte buffer.
     *
     * Integers are reassembled as two's complement. Floating-point
     * types take the bit pattern verbatim; NaN payloads, infinities
     * and denormals are not touched.
     *
     * @param b A pointer to at least sizeof(T) bytes of data.
     */
    template <typename T>
    inline T readBe(const uint8_t* b)
    {
        static_assert(std::is_arithmetic_v<T>, "readBe needs an arithmetic type");

        if constexpr (sizeof(T) == 1)
        {
            return static_cast<T>(b[0]);
        }
        else if constexpr (sizeof(T) == 2)
        {
            return static_cast<T>(readBeUShort(b));
        }
        else if constexpr (std::is_floating_point_v<T> && sizeof(T) == 4)
        {
            return bitCast<T>(readBeUInt(b));
        }
        else if constexpr (std::is_floating_point_v<T> && sizeof(T) == 8)
        {
            return bitCast<T>(readBeULong(b));
        }
        else if constexpr (sizeof(T) == 4)
        {
            return static_cast<T>(readBeUInt(b));
        }
        else
        {
            static_assert(sizeof(T) == 8, "unsupported width");
            return static_cast<T>(readBeULong(b));
        }
    }

} // namespace utils
} // namespace javaio
