#include <gtest/gtest.h>

#include "byte_stream.hpp"

using namespace sandor_laboratories::ippo;

TEST(byte_stream, writes_big_endian)
{
  octet_buffer_t buffer;

  write_u8 (&buffer, 0x01);
  write_u16(&buffer, 0x0203);
  write_u32(&buffer, 0x04050607);
  write_i32(&buffer, -2);

  const octet_buffer_t expected = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0xFF, 0xFF, 0xFF, 0xFE};
  EXPECT_EQ(expected, buffer);
}

TEST(byte_stream, reads_do_not_advance_past_end)
{
  const octet_buffer_t buffer = {0x12, 0x34, 0x56};
  byte_cursor_s cursor = make_byte_cursor(buffer);
  uint16_t half_word = 0;
  uint32_t word = 0;

  ASSERT_TRUE(read_u16(&cursor, &half_word));
  EXPECT_EQ(0x1234, half_word);
  EXPECT_FALSE(read_u32(&cursor, &word));
  EXPECT_EQ(2u, cursor.offset);
  EXPECT_EQ(1u, remaining_bytes(&cursor));
  EXPECT_FALSE(skip_bytes(&cursor, 2));
  EXPECT_TRUE(skip_bytes(&cursor, 1));
  EXPECT_EQ(0u, remaining_bytes(&cursor));
}

TEST(byte_stream, null_buffer_is_empty)
{
  byte_cursor_s cursor = make_byte_cursor(nullptr, 10);
  uint8_t byte = 0;

  EXPECT_EQ(0u, cursor.size);
  EXPECT_FALSE(read_u8(&cursor, &byte));
}

TEST(byte_stream, fixed_string_is_padded_and_terminated)
{
  octet_buffer_t buffer;

  write_fixed_string(&buffer, "abcdef", 4);
  ASSERT_EQ(4u, buffer.size());
  EXPECT_EQ('a', buffer[0]);
  EXPECT_EQ('c', buffer[2]);
  EXPECT_EQ(0,   buffer[3]);

  buffer.clear();
  write_fixed_string(&buffer, "", 8);
  EXPECT_EQ(octet_buffer_t(8, 0), buffer);
}
