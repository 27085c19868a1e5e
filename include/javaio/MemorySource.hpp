/**
 * @file MemorySource.hpp
 * @brief ByteSource over a block of memory the caller owns.
 *
 * This class wraps a std::span (C++20) and keeps a cursor into it.
 * The span is never copied; the caller keeps the bytes alive for as
 * long as the source is in use.
 */

#pragma once

#include "ByteSource.hpp"
#include <cstdint>
#include <cstddef>
#include <span>

namespace javaio
{
    class MemorySource : public ByteSource
    {
    public:
        MemorySource() = default;

        /**
         * @brief Views a block of memory, cursor at its start.
         * @param data A span of bytes to read from.
         */
        explicit MemorySource(std::span<const uint8_t> data) : m_span(data) {}

        /**
         * @brief Copies the next @p length bytes out of the view.
         *
         * On shortfall the cursor is moved to the end of the view before
         * EndOfInput is thrown.
         */
        void readFully(uint8_t* buffer, size_t length) override;

        /**
         * @brief Replaces the viewed memory and resets the cursor.
         */
        void setData(std::span<const uint8_t> data)
        {
            m_span = data;
            m_pos = 0;
        }

        /// @brief Bytes consumed so far.
        size_t position() const { return m_pos; }

        /// @brief Bytes left before the end of the view.
        size_t remaining() const { return m_span.size() - m_pos; }

        /// @brief Total size of the view.
        size_t size() const { return m_span.size(); }

    private:
        /// @brief A non-owning view of the caller's bytes.
        std::span<const uint8_t> m_span;
        size_t m_pos = 0;
    };

} // namespace javaio
