/**
 * @file FileSource.hpp
 * @brief ByteSource that opens and owns a file.
 */

#pragma once

#include "ByteSource.hpp"
#include "StreamSource.hpp"
#include <cstdint>
#include <fstream>
#include <string>

namespace javaio
{
    class FileSource : public ByteSource
    {
    public:
        /**
         * @brief Constructor.
         * Opens the file in binary mode, positioned at its first byte.
         * @param filepath Path to the file.
         * @throws std::runtime_error if the file cannot be opened.
         */
        explicit FileSource(const std::string& filepath);

        /**
         * @brief Destructor. Closes the file handle.
         */
        ~FileSource() override;

        FileSource(const FileSource&) = delete;
        FileSource& operator=(const FileSource&) = delete;

        void readFully(uint8_t* buffer, size_t length) override;

        /**
         * @brief Gets the number of bytes consumed from the file.
         */
        int64_t position() const { return m_source.position(); }

        const std::string& getPath() const { return m_path; }

    private:
        std::string m_path;
        std::ifstream m_fileStream;
        StreamSource m_source; // Reads through m_fileStream
    };

} // namespace javaio
