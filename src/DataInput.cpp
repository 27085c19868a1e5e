/**
 * @file DataInput.cpp
 * @brief Implementation of the DataInput class.
 */

#include "javaio/DataInput.hpp"
#include "utils/BinaryIO.hpp" // Use the central utility
#include "ModifiedUtf8.hpp"

namespace javaio
{

// --- Raw Bytes ---

void DataInput::readFully(uint8_t* buffer, size_t length, const char* dtype)
try
{
    m_source.readFully(buffer, length);
}
catch (const EndOfInput&)
{
    throw EndOfInput(dtype);
}

void DataInput::readFully(uint8_t* buffer, size_t length)
{
    readFully(buffer, length, "bytes");
}

void DataInput::readFully(std::vector<uint8_t>& buffer, size_t length)
{
    std::vector<uint8_t> bytes(length);
    readFully(bytes.data(), length, "bytes");
    buffer.swap(bytes);
}

// --- Fixed-width Readers ---

template <typename T>
T DataInput::readPrimitive(const char* dtype)
{
    uint8_t b[sizeof(T)];
    readFully(b, sizeof(T), dtype);
    return utils::readBe<T>(b);
}

int8_t DataInput::readByte()
{
    return readPrimitive<int8_t>("byte");
}

uint8_t DataInput::readUnsignedByte()
{
    return readPrimitive<uint8_t>("unsigned byte");
}

bool DataInput::readBoolean()
{
    return readPrimitive<uint8_t>("boolean") != 0;
}

int16_t DataInput::readShort()
{
    return readPrimitive<int16_t>("short");
}

uint16_t DataInput::readUnsignedShort()
{
    return readPrimitive<uint16_t>("unsigned short");
}

char16_t DataInput::readChar()
{
    return static_cast<char16_t>(readPrimitive<uint16_t>("char"));
}

int32_t DataInput::readInt()
{
    return readPrimitive<int32_t>("int");
}

int64_t DataInput::readLong()
{
    return readPrimitive<int64_t>("long");
}

float DataInput::readFloat()
{
    return readPrimitive<float>("float");
}

double DataInput::readDouble()
{
    return readPrimitive<double>("double");
}

// --- Strings ---

std::vector<uint8_t> DataInput::readUtfPayload()
{
    uint16_t length = readPrimitive<uint16_t>("UTF length");
    std::vector<uint8_t> bytes(length);
    readFully(bytes.data(), length, "UTF payload");
    return bytes;
}

std::u16string DataInput::readUtf16()
{
    std::vector<uint8_t> bytes = readUtfPayload();
    return utf::decodeModifiedUtf8(bytes);
}

std::string DataInput::readUtf()
{
    return utf::utf16ToUtf8(readUtf16());
}

} // namespace javaio
