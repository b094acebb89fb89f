#include <gtest/gtest.h>

#include <array>
#include <cstring>

#include "database/row.hpp"

using RowBuffer = std::array<std::byte, ROW_SIZE>;

TEST(Row, Size) {
  EXPECT_EQ(291u, ROW_SIZE);
  EXPECT_EQ(4u, USERNAME_OFFSET);
  EXPECT_EQ(36u, EMAIL_OFFSET);
}

TEST(Row, SerialiseThenDeserialise) {
  RowBuffer buf{};
  const Row row = {1, "john", "john@test.com"};
  serialise(row, buf);
  EXPECT_EQ(row, deserialise(buf));
}

/* the encoding is fixed width, short text is zero padded */
TEST(Row, Layout) {
  RowBuffer buf;
  buf.fill(static_cast<std::byte>(0xFF));
  serialise(Row{0x01020304, "ab", "c"}, buf);

  EXPECT_EQ(0x04, static_cast<u8>(buf[0]));
  EXPECT_EQ(0x03, static_cast<u8>(buf[1]));
  EXPECT_EQ(0x02, static_cast<u8>(buf[2]));
  EXPECT_EQ(0x01, static_cast<u8>(buf[3]));

  EXPECT_EQ('a', static_cast<char>(buf[USERNAME_OFFSET]));
  EXPECT_EQ('b', static_cast<char>(buf[USERNAME_OFFSET + 1]));
  for (u32 i = USERNAME_OFFSET + 2; i < EMAIL_OFFSET; i++)
  {
    EXPECT_EQ(0, static_cast<u8>(buf[i])) << "username byte " << i;
  }

  EXPECT_EQ('c', static_cast<char>(buf[EMAIL_OFFSET]));
  for (u32 i = EMAIL_OFFSET + 1; i < ROW_SIZE; i++)
  {
    EXPECT_EQ(0, static_cast<u8>(buf[i])) << "email byte " << i;
  }
}

/* text filling the whole field has no terminator and is still read back */
TEST(Row, MaxLengthFields) {
  RowBuffer buf{};
  const Row row = {42, std::string(COLUMN_USERNAME_SIZE, 'a'), std::string(COLUMN_EMAIL_SIZE, 'b')};
  serialise(row, buf);
  EXPECT_EQ(row, deserialise(buf));
}

TEST(Row, EmptyFields) {
  RowBuffer buf{};
  const Row row = {0, "", ""};
  serialise(row, buf);
  EXPECT_EQ(row, deserialise(buf));
}

TEST(Row, OverlongTextIsTruncated) {
  RowBuffer buf{};
  serialise(Row{1, std::string(40, 'u'), "e"}, buf);
  EXPECT_EQ(std::string(COLUMN_USERNAME_SIZE, 'u'), deserialise(buf).username);
  EXPECT_EQ("e", deserialise(buf).email);
}

TEST(Row, MultiByteText) {
  RowBuffer buf{};
  const Row row = {7, "j\xC3\xBCrgen", "\xE2\x9C\x89@\xF0\x9F\x98\x80.com"};
  serialise(row, buf);
  EXPECT_EQ(row, deserialise(buf, DecodeMode::Strict));
}

/* invalid utf-8 is replaced rather than failing */
TEST(Row, LossyDecode) {
  RowBuffer buf{};
  serialise(Row{3, "ok", "x"}, buf);
  buf[USERNAME_OFFSET + 1] = static_cast<std::byte>(0xFF);

  const Row row = deserialise(buf);
  EXPECT_EQ(3u, row.id);
  EXPECT_EQ("o\xEF\xBF\xBD", row.username);
  EXPECT_EQ("x", row.email);
}

/* a truncated multi byte sequence is one replacement, then decoding carries on */
TEST(Row, LossyDecodeTruncatedSequence) {
  RowBuffer buf{};
  serialise(Row{3, "a\xE2\x9C" "b", "x"}, buf);
  EXPECT_EQ("a\xEF\xBF\xBD" "b", deserialise(buf).username);
}

TEST(Row, StrictDecodeThrows) {
  RowBuffer buf{};
  serialise(Row{3, "ok", "x"}, buf);
  buf[EMAIL_OFFSET] = static_cast<std::byte>(0xC0);

  EXPECT_THROW(deserialise(buf, DecodeMode::Strict), DecodeError);
  EXPECT_NO_THROW(deserialise(buf, DecodeMode::Lossy));
}

TEST(Row, BufferTooSmall) {
  std::array<std::byte, ROW_SIZE - 1> buf{};
  EXPECT_THROW(serialise(Row{1, "a", "b"}, buf), std::out_of_range);
  EXPECT_THROW(deserialise(buf), std::out_of_range);
}
