#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;

// all integers on disk are little-endian regardless of the host

inline void writeLittleu8(std::span<std::byte> out, u8 v)
{
  out[0] = static_cast<std::byte>(v);
}

inline u8 readLittleu8(std::span<const std::byte> in)
{
  return static_cast<u8>(in[0]);
}

inline void writeLittleu32(std::span<std::byte> out, u32 v)
{
  out[0] = static_cast<std::byte>((v >> 0) & 0xFF);
  out[1] = static_cast<std::byte>((v >> 8) & 0xFF);
  out[2] = static_cast<std::byte>((v >> 16) & 0xFF);
  out[3] = static_cast<std::byte>((v >> 24) & 0xFF);
}

inline u32 readLittleu32(std::span<const std::byte> in)
{
  return (static_cast<u32>(in[0]) << 0) |
         (static_cast<u32>(in[1]) << 8) |
         (static_cast<u32>(in[2]) << 16) |
         (static_cast<u32>(in[3]) << 24);
}
