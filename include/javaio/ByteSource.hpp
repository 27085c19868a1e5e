/**
 * @file ByteSource.hpp
 * @brief Abstract base class for anything the decoders can read from.
 *
 * The decoders never touch a concrete stream type. They only need the
 * ability to pull an exact number of bytes off the front of a source,
 * which is what this interface captures. In-memory buffers, borrowed
 * std::istreams and owned files all implement it.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace javaio
{
    /**
     * @class ByteSource
     * @brief A bounded, sequential byte reader.
     */
    class ByteSource
    {
    public:
        virtual ~ByteSource() = default;

        /**
         * @brief Reads exactly @p length bytes into @p buffer.
         *
         * Advances the read position by @p length. If fewer bytes remain,
         * whatever was delivered before exhaustion stays consumed (there
         * is no rollback) and EndOfInput is thrown.
         *
         * @param buffer Destination, at least @p length bytes long.
         * @param length Number of bytes to read.
         * @throws javaio::EndOfInput if the source is exhausted first.
         */
        virtual void readFully(uint8_t* buffer, size_t length) = 0;
    };

} // namespace javaio
