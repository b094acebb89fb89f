#pragma once

#include "machine.hpp"

#include <span>
#include <stdexcept>
#include <string>

const u32 COLUMN_USERNAME_SIZE = 32;
const u32 COLUMN_EMAIL_SIZE = 255;

// serialised row layout: | id | username | email |
const u32 ID_SIZE = sizeof(u32);
const u32 USERNAME_SIZE = COLUMN_USERNAME_SIZE;
const u32 EMAIL_SIZE = COLUMN_EMAIL_SIZE;
const u32 ID_OFFSET = 0;
const u32 USERNAME_OFFSET = ID_OFFSET + ID_SIZE;
const u32 EMAIL_OFFSET = USERNAME_OFFSET + USERNAME_SIZE;
const u32 ROW_SIZE = ID_SIZE + USERNAME_SIZE + EMAIL_SIZE;

struct Row
{
  u32 id = 0;
  std::string username;
  std::string email;

  friend bool operator==(const Row &a, const Row &b)
  {
    return a.id == b.id && a.username == b.username && a.email == b.email;
  }
};

/* how text fields that are not valid UTF-8 are treated when reading a row back.
 * Lossy replaces each bad sequence with U+FFFD so decoding never fails,
 * Strict throws a DecodeError instead */
enum class DecodeMode
{
  Lossy,
  Strict,
};

class DecodeError : public std::runtime_error
{
public:
  explicit DecodeError(const std::string &field)
      : std::runtime_error("Invalid UTF-8 in field '" + field + "'")
  {
  }
};

// write the row into exactly ROW_SIZE bytes, text fields are zero padded
void serialise(const Row &row, std::span<std::byte> destination);

// read a row from ROW_SIZE bytes, text ends at the first zero byte or the field width
Row deserialise(std::span<const std::byte> source, DecodeMode mode = DecodeMode::Lossy);
