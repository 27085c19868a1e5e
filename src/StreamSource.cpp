/**
 * @file StreamSource.cpp
 * @brief Implementation of the StreamSource class.
 */

#include "javaio/StreamSource.hpp"
#include "javaio/Errors.hpp"

namespace javaio
{

void StreamSource::readFully(uint8_t* buffer, size_t length)
{
    if (length == 0) return;

    m_stream.read(reinterpret_cast<char*>(buffer),
                  static_cast<std::streamsize>(length));
    std::streamsize got = m_stream.gcount();
    m_nBytes += got;

    if (got != static_cast<std::streamsize>(length))
    {
        throw EndOfInput();
    }
}

} // namespace javaio
