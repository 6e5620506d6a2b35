#include <gtest/gtest.h>
#include <stdexcept>
#include "frontier/binary/reader.hpp"
#include "frontier/binary/writer.hpp"

using namespace Frontier::Binary;

TEST(BinaryTest, BigEndianLayout) {
    std::vector<uint8_t> buf;
    Writer               writer(buf);
    writer.write_uint8(0xAB);
    writer.write_uint32(0x01020304);
    writer.write_uint64(0x0102030405060708ULL);

    std::vector<uint8_t> expected = {0xAB, 1, 2, 3, 4, 1, 2, 3, 4, 5, 6, 7, 8};
    EXPECT_EQ(buf, expected);
    EXPECT_EQ(writer.size(), 13);
}

TEST(BinaryTest, ReadBack) {
    std::vector<uint8_t> buf;
    Writer               writer(buf);
    writer.write_uint32(42);
    writer.write_int64(-1234567890123LL);
    writer.write_double(2.5);
    writer.write_bool(true);
    writer.write_bytes("hello");
    writer.write_bytes("");
    writer.write_raw("RAW");

    Reader reader(buf);
    EXPECT_EQ(reader.read_uint32(), 42);
    EXPECT_EQ(reader.read_int64(), -1234567890123LL);
    EXPECT_DOUBLE_EQ(reader.read_double(), 2.5);
    EXPECT_TRUE(reader.read_bool());
    EXPECT_EQ(reader.read_bytes(), "hello");
    EXPECT_EQ(reader.read_bytes(), "");
    EXPECT_EQ(reader.remaining(), 3);
    EXPECT_EQ(reader.read_raw(3), "RAW");
    EXPECT_TRUE(reader.eof());
}

TEST(BinaryTest, ReadPastEndThrows) {
    std::vector<uint8_t> buf = {0, 0, 0, 10, 'a', 'b'};
    Reader               reader(buf);
    EXPECT_THROW(reader.read_bytes(), std::out_of_range);

    Reader short_reader(buf);
    short_reader.read_raw(4);
    EXPECT_THROW(short_reader.read_uint32(), std::out_of_range);
    EXPECT_EQ(short_reader.read_uint8(), 'a');
}

TEST(BinaryTest, EmptyBuffer) {
    std::vector<uint8_t> buf;
    Reader               reader(buf);
    EXPECT_TRUE(reader.eof());
    EXPECT_THROW(reader.read_uint8(), std::out_of_range);
}
