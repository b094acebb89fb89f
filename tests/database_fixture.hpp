#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#if defined(_WIN32)
#include <windows.h>
#else
#include <unistd.h>
#endif

// gives each test its own database file path, removed afterwards unless the test failed
class TempFileFixture : public ::testing::Test
{
protected:
  void SetUp() override
  {
    m_name = makeUniqueName();
    path = std::filesystem::temp_directory_path() / m_name;
  }

  void TearDown() override {
    if (HasFailure())
    {
      std::cerr << "Failed database file at: " << path << std::endl;
    }
    else
    {
      if (std::filesystem::exists(path))
      {
        std::filesystem::remove(path);
      }
    }
  }

  // replace the database file with `size` bytes of `fill`
  void writeFile(std::size_t size, char fill = 0)
  {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(out) << "could not create " << path;
    const std::string bytes(size, fill);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    ASSERT_TRUE(out);
  }

  std::uintmax_t fileSize() const
  {
    return std::filesystem::file_size(path);
  }

  std::filesystem::path path;

private:
    std::string makeUniqueName()
    {
      static unsigned long counter = 0;
      auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
#if defined(_WIN32)
      unsigned long pid = GetCurrentProcessId();
#else
      unsigned long pid = static_cast<unsigned long>(::getpid());
#endif
      char buf[128];
      std::snprintf(buf, sizeof(buf), "rowstore_test_%llx_%lx_%lu.db",
                    static_cast<unsigned long long>(now), pid, counter++);
      return std::string(buf);
    }

    std::string m_name;
};

/* a stream that claims to be `size` bytes long but fails every read and write,
 * like a file on a device that has gone away */
class BrokenStreamBuf : public std::streambuf
{
public:
  explicit BrokenStreamBuf(std::streamoff size) : m_size(size) {}

protected:
  pos_type seekoff(off_type off, std::ios_base::seekdir dir, std::ios_base::openmode) override
  {
    if (dir == std::ios_base::beg)
      m_pos = off;
    else if (dir == std::ios_base::cur)
      m_pos += off;
    else
      m_pos = m_size + off;
    return pos_type(m_pos);
  }

  pos_type seekpos(pos_type pos, std::ios_base::openmode) override
  {
    m_pos = pos;
    return pos;
  }

  // underflow and overflow keep their default, they report end of file

private:
  std::streamoff m_size;
  std::streamoff m_pos = 0;
};
