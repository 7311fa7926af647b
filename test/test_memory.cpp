#include "exception.hpp"
#include "memory_reader.hpp"
#include "memory_writer.hpp"
#include "test_util.hpp"
#include <gtest/gtest.h>

using namespace docjson;

TEST(MemoryWriterTest, GrowsPastInitialCapacity) {
  JsonMemoryWriter writer(4);
  ASSERT_EQ(writer.capacity(), 4u);

  writer.write(std::string_view("0123456789"));
  ASSERT_EQ(writer.position(), 10u);
  ASSERT_GE(writer.capacity(), 10u);
  ASSERT_EQ(text_of(writer.written()), "0123456789");
}

TEST(MemoryWriterTest, LittleEndianValues) {
  JsonMemoryWriter writer(1);
  writer.write_little_endian(static_cast<uint16_t>(0x0102));
  writer.write_little_endian(static_cast<int32_t>(-2));
  ASSERT_EQ(copy_of(writer.written()), make_bytes({0x02, 0x01, 0xfe, 0xff, 0xff, 0xff}));
}

TEST(MemoryWriterTest, SetPosition) {
  JsonMemoryWriter writer(8);
  writer.write(std::string_view("abcd"));
  writer.set_position(1);
  writer.write_byte('X');
  writer.set_position(4);
  ASSERT_EQ(text_of(writer.written()), "aXcd");

  try {
    writer.set_position(writer.capacity() + 1);
    FAIL() << "expected an exception";
  } catch (const docjson::exception &e) {
    ASSERT_EQ(e.code(), JsonErrorCode::IndexOutOfRange);
  }
}

TEST(MemoryWriterTest, RejectsGrowthBeyondMaximum) {
  JsonMemoryWriter writer(4);
  writer.write_byte(1);
  try {
    writer.ensure_remaining_buffer_space(config::max_buffer_capacity);
    FAIL() << "expected an exception";
  } catch (const docjson::exception &e) {
    ASSERT_EQ(e.code(), JsonErrorCode::InvalidLength);
  }
}

TEST(MemoryReaderTest, ReadPeekAdvance) {
  JsonMemoryReader reader(bytes_of("abc"));
  ASSERT_FALSE(reader.is_eof());
  ASSERT_EQ(reader.peek(), 'a');
  ASSERT_EQ(reader.peek(2), 'c');
  ASSERT_EQ(reader.read(), 'a');
  reader.advance(1);
  ASSERT_EQ(reader.position(), 2u);
  ASSERT_EQ(reader.read(), 'c');
  ASSERT_TRUE(reader.is_eof());
  // past the end reads yield zero
  ASSERT_EQ(reader.peek(), 0);
  ASSERT_EQ(text_of(reader.get_buffered_raw_json_token(1)), "bc");
  ASSERT_EQ(text_of(reader.get_buffered_raw_json_token(0, 2)), "ab");
}
