#include "database/pager.hpp"

std::span<std::byte> Page::slice(u32 offset, u32 length)
{
  if (offset > buf.size() || length > buf.size() - offset)
  {
    throw std::out_of_range("Slice out of page bounds");
  }
  return std::span<std::byte>(buf.data() + offset, length);
}

std::span<const std::byte> Page::slice(u32 offset, u32 length) const
{
  if (offset > buf.size() || length > buf.size() - offset)
  {
    throw std::out_of_range("Slice out of page bounds");
  }
  return std::span<const std::byte>(buf.data() + offset, length);
}

Pager::Pager(const std::filesystem::path &path)
{
  if (!std::filesystem::exists(path))
  {
    // fstream will not create a file when opened for reading as well
    std::ofstream create(path, std::ios::out | std::ios::binary);
    if (!create)
    {
      throw std::runtime_error("Failed to create database file " + path.string());
    }
  }

  m_file = std::make_unique<std::fstream>(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!*m_file)
  {
    throw std::runtime_error("Failed to open database file " + path.string());
  }
  m_stream = m_file.get();

  readFileSize();
}

Pager::Pager(std::iostream &stream)
: m_stream(&stream)
{
  if (!*m_stream)
  {
    throw std::runtime_error("Failed to open database file.");
  }

  readFileSize();
}

void Pager::readFileSize()
{
  m_stream->seekg(0, std::ios::end);
  const std::streamoff size = m_stream->tellg();
  if (!*m_stream || size < 0)
  {
    throw std::runtime_error("Failed to get size of database file.");
  }

  if (size % PAGE_SIZE != 0)
  {
    std::ostringstream ss;
    ss << "Database file is " << size << " bytes, not a whole number of " << PAGE_SIZE
       << " byte pages. Corrupt file.";
    throw FormatError(ss.str());
  }
  if (size / PAGE_SIZE > TABLE_MAX_PAGES)
  {
    std::ostringstream ss;
    ss << "Database file has " << size / PAGE_SIZE << " pages, more than the " << TABLE_MAX_PAGES
       << " a table can hold.";
    throw FormatError(ss.str());
  }
  m_fSize = static_cast<u32>(size);

  m_numPages = m_fSize / PAGE_SIZE;
}

Page &Pager::getPage(PageId pageNum)
{
  if (pageNum >= TABLE_MAX_PAGES)
  {
    throw PageError(pageNum, "Page number out of bounds");
  }
  if (!isOpen())
  {
    throw PageError(pageNum, "Pager is closed");
  }

  auto cached = m_pages.find(pageNum);
  if (cached != m_pages.end())
  {
    return *cached->second;
  }

  // cache miss, allocate a zeroed page and load it if it is within the file
  auto page = std::make_unique<Page>();
  const u32 pagesOnDisk = m_fSize / PAGE_SIZE;
  if (pageNum < pagesOnDisk)
  {
    m_stream->clear();
    if (!m_stream->seekg(static_cast<std::streamoff>(pageNum) * PAGE_SIZE))
    {
      throw PageError(pageNum, "Failed in seeking to read");
    }
    if (!m_stream->read(reinterpret_cast<char *>(page->buf.data()), page->buf.size()))
    {
      throw PageError(pageNum, "Failed to read");
    }
  }

  if (pageNum >= m_numPages)
  {
    m_numPages = pageNum + 1;
  }

  Page &ref = *page;
  m_pages[pageNum] = std::move(page);
  return ref;
}

void Pager::flushPage(PageId pageNum)
{
  auto cached = m_pages.find(pageNum);
  if (cached == m_pages.end())
  {
    return;
  }
  if (!isOpen())
  {
    throw PageError(pageNum, "Pager is closed");
  }

  const Page &page = *cached->second;
  m_stream->clear();
  if (!m_stream->seekp(static_cast<std::streamoff>(pageNum) * PAGE_SIZE))
  {
    throw PageError(pageNum, "Failed in seeking to flush");
  }
  if (!m_stream->write(reinterpret_cast<const char *>(page.buf.data()), page.buf.size()))
  {
    throw PageError(pageNum, "Failed to flush");
  }

  if ((pageNum + 1) * PAGE_SIZE > m_fSize)
  {
    m_fSize = (pageNum + 1) * PAGE_SIZE;
  }
}

void Pager::release() noexcept
{
  m_stream = nullptr;
  m_pages.clear();
  // fstream's destructor closes the file without throwing
  m_file.reset();
}

void Pager::close()
{
  if (!isOpen())
  {
    return;
  }

  std::iostream *stream = m_stream;
  m_stream = nullptr;
  m_pages.clear();

  stream->clear();
  if (!stream->flush())
  {
    throw std::runtime_error("Failed to flush database file.");
  }
  if (m_file)
  {
    m_file->close();
    if (m_file->fail())
    {
      throw std::runtime_error("Failed to close database file.");
    }
    m_file.reset();
  }
}
