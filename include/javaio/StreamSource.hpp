/**
 * @file StreamSource.hpp
 * @brief ByteSource over a std::istream borrowed from the caller.
 */

#pragma once

#include "ByteSource.hpp"
#include <cstdint>
#include <cstddef>
#include <istream>

namespace javaio
{
    /**
     * @class StreamSource
     * @brief Reads from any std::istream opened in binary mode.
     *
     * The stream is borrowed and must outlive this object. Blocking
     * behaviour is whatever the stream's buffer does.
     */
    class StreamSource : public ByteSource
    {
    public:
        explicit StreamSource(std::istream& stream) : m_stream(stream) {}

        void readFully(uint8_t* buffer, size_t length) override;

        /**
         * @brief Bytes consumed through this source, including the
         * delivered part of a read that ran out.
         */
        int64_t position() const { return m_nBytes; }

    private:
        std::istream& m_stream;
        int64_t m_nBytes = 0;
    };

} // namespace javaio
