/**
 * @file DataInput.hpp
 * @brief The main user-facing API for decoding Java DataInput values.
 *
 * DataInput pulls big-endian primitives and modified UTF-8 strings off
 * a ByteSource, in exactly the layout java.io.DataOutputStream writes
 * them. It holds nothing but a reference to the source; each call reads
 * exactly the bytes its format needs and nothing more.
 *
 * @see java.io.DataInput
 */

#pragma once

#include "ByteSource.hpp"
#include "Errors.hpp"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace javaio
{
    /**
     * @class DataInput
     * @brief Stateless decoder over a borrowed ByteSource.
     *
     * The source must outlive the DataInput. Every read either returns
     * a complete value or throws; on failure the source keeps whatever
     * bytes were already consumed.
     */
    class DataInput
    {
    public:
        /**
         * @brief Constructor.
         * @param source The byte source to read from. Not owned.
         */
        explicit DataInput(ByteSource& source) : m_source(source) {}

        // --- Fixed-width Readers ---

        /**
         * @brief Reads a 1-byte signed integer.
         * @throws javaio::EndOfInput
         */
        int8_t readByte();

        /**
         * @brief Reads a 1-byte unsigned integer.
         */
        uint8_t readUnsignedByte();

        /**
         * @brief Reads one byte; any non-zero value is true.
         */
        bool readBoolean();

        /**
         * @brief Reads a 2-byte big-endian signed short.
         */
        int16_t readShort();

        /**
         * @brief Reads a 2-byte big-endian unsigned short.
         */
        uint16_t readUnsignedShort();

        /**
         * @brief Reads a 2-byte big-endian UTF-16 code unit.
         */
        char16_t readChar();

        /**
         * @brief Reads a 4-byte big-endian signed integer.
         */
        int32_t readInt();

        /**
         * @brief Reads an 8-byte big-endian signed long.
         */
        int64_t readLong();

        /**
         * @brief Reads a 4-byte big-endian IEEE-754 single.
         * The bit pattern is taken as-is, NaN payloads included.
         */
        float readFloat();

        /**
         * @brief Reads an 8-byte big-endian IEEE-754 double.
         */
        double readDouble();

        // --- Strings ---

        /**
         * @brief Reads a length-prefixed modified UTF-8 string.
         *
         * Consumes a 2-byte unsigned length L and then exactly L bytes of
         * payload. The decoded UTF-16 is returned re-encoded as UTF-8.
         *
         * @return The string, as UTF-8.
         * @throws javaio::EndOfInput if the prefix, payload or a
         * continuation byte is cut short.
         * @throws javaio::InvalidData on a bad lead byte, a bad
         * continuation byte, or an unpaired surrogate.
         * @see java.io.DataInput#readUTF()
         */
        std::string readUtf();

        /**
         * @brief Like readUtf(), but returns the raw UTF-16 code units.
         *
         * Lone surrogates are kept, so any string the writer could
         * produce comes back unchanged.
         */
        std::u16string readUtf16();

        // --- Raw Bytes ---

        /**
         * @brief Reads a block of data fully.
         * @param buffer Buffer to fill.
         * @param length Number of bytes to read.
         * @throws javaio::EndOfInput
         */
        void readFully(uint8_t* buffer, size_t length);

        /**
         * @brief Fills a vector with the specified number of bytes.
         * @param buffer The vector to fill; replaced only if all
         * @p length bytes were read.
         * @param length Number of bytes to read.
         */
        void readFully(std::vector<uint8_t>& buffer, size_t length);

    private:
        template <typename T>
        T readPrimitive(const char* dtype);

        void readFully(uint8_t* buffer, size_t length, const char* dtype);

        std::vector<uint8_t> readUtfPayload();

        ByteSource& m_source;
    };

} // namespace javaio
