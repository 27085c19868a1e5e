#include <gtest/gtest.h>
#include "javaio/DataInput.hpp"
#include "javaio/MemorySource.hpp"
#include "javaio/StreamSource.hpp"
#include "javaio/FileSource.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdio>

using namespace javaio;

namespace
{
    // byte -64, utf "Aμ", int -1073741824
    const std::vector<uint8_t> kRecord = {
        0xC0,
        0x00, 0x03, 0x41, 0xCE, 0xBC,
        0xC0, 0x00, 0x00, 0x00,
    };

    std::string asString(const std::vector<uint8_t>& bytes)
    {
        return std::string(bytes.begin(), bytes.end());
    }
}

TEST(MemorySource, ReadFullyAdvances) {
    MemorySource source(kRecord);
    uint8_t b[3];

    source.readFully(b, 3);
    EXPECT_EQ(b[0], 0xC0);
    EXPECT_EQ(b[2], 0x03);
    EXPECT_EQ(source.position(), 3u);
    EXPECT_EQ(source.remaining(), kRecord.size() - 3);

    source.readFully(b, 0);
    EXPECT_EQ(source.position(), 3u);
}

TEST(MemorySource, ShortfallMovesToEnd) {
    MemorySource source(kRecord);
    std::vector<uint8_t> out(kRecord.size() + 1);

    EXPECT_THROW(source.readFully(out.data(), out.size()), EndOfInput);
    EXPECT_EQ(source.position(), kRecord.size());
    EXPECT_EQ(source.remaining(), 0u);
}

TEST(MemorySource, SetDataResetsCursor) {
    std::vector<uint8_t> other = {0x12, 0x34};
    MemorySource source(kRecord);
    uint8_t b[2];
    source.readFully(b, 2);

    source.setData(other);
    EXPECT_EQ(source.position(), 0u);
    EXPECT_EQ(source.size(), 2u);

    DataInput in(source);
    EXPECT_EQ(in.readShort(), 0x1234);
}

TEST(StreamSource, DecodesLikeMemory) {
    std::istringstream stream(asString(kRecord));
    StreamSource source(stream);
    DataInput in(source);

    EXPECT_EQ(in.readByte(), -64);
    EXPECT_EQ(source.position(), 1);
    EXPECT_EQ(in.readUtf(), "A\xCE\xBC");
    EXPECT_EQ(source.position(), 6);
    EXPECT_EQ(in.readInt(), -1073741824);
    EXPECT_EQ(source.position(), 10);

    EXPECT_THROW(in.readByte(), EndOfInput);
    EXPECT_EQ(source.position(), 10);
}

TEST(StreamSource, ShortfallKeepsDeliveredBytes) {
    std::istringstream stream(asString({0x00, 0x01, 0x02}));
    StreamSource source(stream);
    DataInput in(source);

    EXPECT_THROW(in.readLong(), EndOfInput);
    EXPECT_EQ(source.position(), 3);
}

class FileSourceTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        m_path = ::testing::TempDir() + "javaio_file_source_test.bin";
        std::ofstream out(m_path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(kRecord.data()),
                  static_cast<std::streamsize>(kRecord.size()));
    }

    void TearDown() override
    {
        std::remove(m_path.c_str());
    }

    std::string m_path;
};

TEST_F(FileSourceTest, DecodesLikeMemory) {
    FileSource file(m_path);
    MemorySource memory(kRecord);
    DataInput fromFile(file);
    DataInput fromMemory(memory);

    EXPECT_EQ(fromFile.readByte(), fromMemory.readByte());
    EXPECT_EQ(fromFile.readUtf(), fromMemory.readUtf());
    EXPECT_EQ(fromFile.readInt(), fromMemory.readInt());
    EXPECT_EQ(file.position(), static_cast<int64_t>(memory.position()));
    EXPECT_EQ(file.getPath(), m_path);

    EXPECT_THROW(fromFile.readShort(), EndOfInput);
}

TEST(FileSource, MissingFileThrows) {
    EXPECT_THROW(FileSource("/nonexistent/javaio/missing.bin"), std::runtime_error);
}
