#pragma once

#include "cursor.hpp"
#include "pager.hpp"
#include "row.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>

enum class ExecuteResult
{
  Success,
  TableFull,
};

class RowScan;

/* a table of rows kept in a single leaf node on the root page.
 * the table owns the pager, and with it the database file */
class Table
{
public:
  explicit Table(const std::filesystem::path &path);
  explicit Table(std::iostream &stream);
  // closes the table if close() was not called, errors are reported on stderr
  ~Table();

  Table(const Table &) = delete;
  Table &operator=(const Table &) = delete;

  /* append the row in a new cell keyed by its id.
   * keys are not searched, inserting an existing id adds a second cell */
  [[nodiscard]] ExecuteResult insert(const Row &row);
  // the rows in insertion order, read lazily as the scan is iterated
  RowScan scan(DecodeMode mode = DecodeMode::Lossy);

  // write every page to disk and release the file. must be the last call on the table
  void close();
  bool isOpen() const noexcept { return m_pager.isOpen(); }

  PageId rootPageNum() const noexcept { return m_rootPageNum; }
  Pager &pager() noexcept { return m_pager; }

private:
  void initialiseRoot();

  PageId m_rootPageNum = 0;
  Pager m_pager;
};

// single pass range over a table's rows, each begin() starts a new cursor
class RowScan
{
public:
  struct iterator;
  iterator begin();
  iterator end();

private:
  friend class Table;
  RowScan(Table &table, DecodeMode mode) noexcept : m_table(&table), m_mode(mode) {}

  Table *m_table;
  DecodeMode m_mode;
};

struct RowScan::iterator
{
  using iterator_category = std::input_iterator_tag;
  using difference_type = std::ptrdiff_t;
  using value_type = Row;
  using pointer = const Row *;
  using reference = const Row &;

  iterator(Cursor cursor, DecodeMode mode);
  iterator() : m_cursor(), m_current(), m_mode(DecodeMode::Lossy), m_isEnd(true) {}

  reference operator*() const noexcept { return m_current; }
  pointer operator->() const noexcept { return &m_current; }
  iterator &operator++();
  iterator operator++(int);
  friend bool operator==(const iterator &a, const iterator &b)
  {
    if (a.m_isEnd && b.m_isEnd)
      return true;
    if (a.m_isEnd != b.m_isEnd)
      return false;
    return a.m_cursor->pageNum() == b.m_cursor->pageNum() &&
           a.m_cursor->cellNum() == b.m_cursor->cellNum();
  }
  friend bool operator!=(const iterator &a, const iterator &b) { return !(a == b); }

private:
  void read();

  std::optional<Cursor> m_cursor;
  Row m_current;
  DecodeMode m_mode;
  bool m_isEnd = false;
};
