/**
 * @file Errors.hpp
 * @brief Exception types raised by the javaio decoders.
 *
 * Every decoding failure falls into one of two kinds: the source ran
 * out of bytes, or the bytes were there but malformed. Callers that
 * need to tell them apart can catch the concrete type, or catch
 * DataInputError and switch on kind().
 */

#pragma once

#include <stdexcept>
#include <string>

namespace javaio
{
    /**
     * @brief The closed set of decoding failure kinds.
     */
    enum class ErrorKind
    {
        EndOfInput,  ///< Source exhausted before the required byte count.
        InvalidData  ///< Bytes present but violating the encoding.
    };

    /**
     * @class DataInputError
     * @brief Common base of all decoding failures.
     */
    class DataInputError : public std::runtime_error
    {
    public:
        DataInputError(ErrorKind kind, const std::string& what)
            : std::runtime_error(what), m_kind(kind) {}

        ErrorKind kind() const { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /**
     * @class EndOfInput
     * @brief Thrown when a source cannot deliver the requested bytes.
     */
    class EndOfInput : public DataInputError
    {
    public:
        EndOfInput()
            : DataInputError(ErrorKind::EndOfInput, "unexpected end of input") {}

        explicit EndOfInput(const std::string& dtype)
            : DataInputError(ErrorKind::EndOfInput,
                             "unexpected end of input while reading " + dtype) {}
    };

    /**
     * @class InvalidData
     * @brief Thrown when encoded bytes do not follow the expected layout.
     */
    class InvalidData : public DataInputError
    {
    public:
        explicit InvalidData(const std::string& reason)
            : DataInputError(ErrorKind::InvalidData, "invalid data: " + reason) {}
    };

} // namespace javaio
