/**
 * @file FileSource.cpp
 * @brief Implementation of the FileSource class.
 */

#include "javaio/FileSource.hpp"
#include <stdexcept>

namespace javaio
{

FileSource::FileSource(const std::string& filepath)
    : m_path(filepath),
      m_fileStream(filepath, std::ios::binary),
      m_source(m_fileStream)
{
    if (!m_fileStream.is_open())
    {
        throw std::runtime_error("Failed to open file: " + filepath);
    }
}

FileSource::~FileSource()
{
    if (m_fileStream.is_open()) m_fileStream.close();
}

void FileSource::readFully(uint8_t* buffer, size_t length)
{
    m_source.readFully(buffer, length);
}

} // namespace javaio
