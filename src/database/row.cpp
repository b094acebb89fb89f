#include "database/row.hpp"

#include <algorithm>
#include <cstring>

namespace
{

// U+FFFD REPLACEMENT CHARACTER
const char REPLACEMENT[] = "\xEF\xBF\xBD";

bool isContinuation(u8 b)
{
  return b >= 0x80 && b <= 0xBF;
}

/* append the bytes as UTF-8 text. returns false when an invalid sequence is found,
 * in which case the sequence is either replaced (lossy) or decoding stops (strict).
 * each maximal invalid subsequence gets one replacement character */
bool appendUtf8(std::span<const std::byte> bytes, std::string &out, DecodeMode mode)
{
  bool valid = true;
  std::size_t i = 0;
  while (i < bytes.size())
  {
    const u8 lead = static_cast<u8>(bytes[i]);
    if (lead < 0x80)
    {
      out.push_back(static_cast<char>(lead));
      i++;
      continue;
    }

    // the sequence length and the allowed range of the second byte depend on the lead byte
    std::size_t length = 0;
    u8 lo = 0x80;
    u8 hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF)
    {
      length = 2;
    }
    else if (lead == 0xE0)
    {
      length = 3;
      lo = 0xA0;
    }
    else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF)
    {
      length = 3;
    }
    else if (lead == 0xED)
    {
      // no surrogates
      length = 3;
      hi = 0x9F;
    }
    else if (lead == 0xF0)
    {
      length = 4;
      lo = 0x90;
    }
    else if (lead >= 0xF1 && lead <= 0xF3)
    {
      length = 4;
    }
    else if (lead == 0xF4)
    {
      length = 4;
      hi = 0x8F;
    }

    std::size_t consumed = 1;
    bool ok = length != 0;
    if (ok)
    {
      if (i + 1 < bytes.size() && static_cast<u8>(bytes[i + 1]) >= lo &&
          static_cast<u8>(bytes[i + 1]) <= hi)
      {
        consumed = 2;
        while (consumed < length)
        {
          if (i + consumed >= bytes.size() || !isContinuation(static_cast<u8>(bytes[i + consumed])))
          {
            ok = false;
            break;
          }
          consumed++;
        }
      }
      else
      {
        ok = false;
      }
    }

    if (ok)
    {
      out.append(reinterpret_cast<const char *>(bytes.data() + i), length);
    }
    else
    {
      valid = false;
      if (mode == DecodeMode::Strict)
      {
        return false;
      }
      out.append(REPLACEMENT);
    }
    i += consumed;
  }

  return valid;
}

void writeText(const std::string &text, std::span<std::byte> field)
{
  std::memset(field.data(), 0, field.size());
  const std::size_t n = std::min(text.size(), field.size());
  std::memcpy(field.data(), text.data(), n);
}

std::string readText(std::span<const std::byte> field, const char *name, DecodeMode mode)
{
  const auto end = std::find(field.begin(), field.end(), static_cast<std::byte>(0));
  const std::size_t length = static_cast<std::size_t>(end - field.begin());

  std::string text;
  text.reserve(length);
  if (!appendUtf8(field.first(length), text, mode) && mode == DecodeMode::Strict)
  {
    throw DecodeError(name);
  }
  return text;
}

} // namespace

void serialise(const Row &row, std::span<std::byte> destination)
{
  if (destination.size() < ROW_SIZE)
  {
    throw std::out_of_range("Row destination smaller than ROW_SIZE");
  }

  writeLittleu32(destination.subspan(ID_OFFSET, ID_SIZE), row.id);
  writeText(row.username, destination.subspan(USERNAME_OFFSET, USERNAME_SIZE));
  writeText(row.email, destination.subspan(EMAIL_OFFSET, EMAIL_SIZE));
}

Row deserialise(std::span<const std::byte> source, DecodeMode mode)
{
  if (source.size() < ROW_SIZE)
  {
    throw std::out_of_range("Row source smaller than ROW_SIZE");
  }

  Row row;
  row.id = readLittleu32(source.subspan(ID_OFFSET, ID_SIZE));
  row.username = readText(source.subspan(USERNAME_OFFSET, USERNAME_SIZE), "username", mode);
  row.email = readText(source.subspan(EMAIL_OFFSET, EMAIL_SIZE), "email", mode);
  return row;
}
