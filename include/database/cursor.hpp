#pragma once

#include "pages/leaf.hpp"
#include "row.hpp"

#include <span>

class Table;

/* a position within the table's cells.
 * only one cursor may be in use on a table at a time */
class Cursor
{
public:
  // the first cell of the root, at the end if the table is empty
  static Cursor start(Table &table);
  // one past the last cell, where the next row is appended
  static Cursor end(Table &table);

  // the row bytes of the current cell. throws std::out_of_range at the end of the table
  std::span<std::byte> value();
  u32 key();

  // write a new cell at the end of the table and move past it
  void insert(u32 key, const Row &row);
  void advance();

  bool isEnd() const noexcept { return m_endOfTable; }
  PageId pageNum() const noexcept { return m_pageNum; }
  u32 cellNum() const noexcept { return m_cellNum; }

private:
  Cursor(Table &table, PageId pageNum, u32 cellNum, bool endOfTable) noexcept
      : m_table(&table), m_pageNum(pageNum), m_cellNum(cellNum), m_endOfTable(endOfTable)
  {
  }

  LeafNode node();

  Table *m_table;
  PageId m_pageNum;
  u32 m_cellNum;
  bool m_endOfTable;
};
