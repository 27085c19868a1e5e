/**
 * @file MemorySource.cpp
 * @brief Implementation of the MemorySource class.
 */

#include "javaio/MemorySource.hpp"
#include "javaio/Errors.hpp"
#include <cstring> // For std::memcpy

namespace javaio
{

void MemorySource::readFully(uint8_t* buffer, size_t length)
{
    if (length > remaining())
    {
        m_pos = m_span.size();
        throw EndOfInput();
    }

    if (length > 0)
    {
        std::memcpy(buffer, m_span.data() + m_pos, length);
    }
    m_pos += length;
}

} // namespace javaio
