#pragma once

#include "pages/page_header.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <memory>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

// a single fixed size block of the database file
struct Page
{
  std::array<std::byte, PAGE_SIZE> buf = {static_cast<std::byte>(0)};

  // view `length` bytes from `offset`. throws std::out_of_range if it would leave the page
  std::span<std::byte> slice(u32 offset, u32 length);
  std::span<const std::byte> slice(u32 offset, u32 length) const;
};

class PageError : public std::exception
{
private:
  std::string m_message;
  PageId m_id;

public:
  PageError(PageId id, const char *message)
      : m_id(id)
  {
    std::ostringstream ss;
    ss << "Page " << id << ": " << message;
    m_message = ss.str();
  }

  inline PageId id() const noexcept
  {
    return m_id;
  }

  const char *what() const noexcept override
  {
    return m_message.c_str();
  }
};

// the file on disk is not made of whole pages
class FormatError : public std::runtime_error
{
public:
  explicit FormatError(const std::string &message) : std::runtime_error(message) {}
};

// manages the pages for the database
// keeps a cache that is flushed to disk
class Pager
{
public:
  // open or create the file at path without truncating it
  explicit Pager(const std::filesystem::path &path);
  // use an already open stream, e.g. a std::stringstream for an in memory database
  explicit Pager(std::iostream &stream);

  Pager(const Pager &) = delete;
  Pager &operator=(const Pager &) = delete;

  /* get a page from the cache, reading it from disk on first use.
   * pages past the end of the file start zeroed. the same page is returned on every call */
  Page &getPage(PageId pageNum);
  // write a cached page back to its slot in the file, does nothing if it was never loaded
  void flushPage(PageId pageNum);
  // flush the stream and release the file. no page may be used afterwards
  void close();
  // drop the cache and the file without writing anything, for when a flush already failed
  void release() noexcept;

  bool isOpen() const noexcept { return m_stream != nullptr; }
  bool isCached(PageId pageNum) const noexcept { return m_pages.count(pageNum) != 0; }
  // one more than the highest page number on disk or in the cache
  u32 numPages() const noexcept { return m_numPages; }
  u32 fsize() const noexcept { return m_fSize; }

private:
  void readFileSize();

  std::unique_ptr<std::fstream> m_file;
  std::iostream *m_stream = nullptr;
  // our cache for the pages
  std::unordered_map<PageId, std::unique_ptr<Page>> m_pages;
  u32 m_fSize = 0;
  u32 m_numPages = 0;
};
