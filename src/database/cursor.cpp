#include "database/cursor.hpp"
#include "database/table.hpp"

Cursor Cursor::start(Table &table)
{
  const PageId root = table.rootPageNum();
  LeafNode leaf(table.pager().getPage(root));
  return Cursor(table, root, 0, leaf.numCells() == 0);
}

Cursor Cursor::end(Table &table)
{
  const PageId root = table.rootPageNum();
  LeafNode leaf(table.pager().getPage(root));
  return Cursor(table, root, leaf.numCells(), true);
}

LeafNode Cursor::node()
{
  return LeafNode(m_table->pager().getPage(m_pageNum));
}

std::span<std::byte> Cursor::value()
{
  if (m_endOfTable)
  {
    throw std::out_of_range("Cursor is at the end of the table");
  }
  return node().value(m_cellNum);
}

u32 Cursor::key()
{
  if (m_endOfTable)
  {
    throw std::out_of_range("Cursor is at the end of the table");
  }
  return node().key(m_cellNum);
}

void Cursor::insert(u32 key, const Row &row)
{
  LeafNode leaf = node();
  const u32 numCells = leaf.numCells();
  if (m_cellNum != numCells)
  {
    // no splitting or shifting of cells yet, rows are only ever appended
    throw std::logic_error("Rows can only be inserted at the end of the table");
  }
  if (leaf.isFull())
  {
    throw std::out_of_range("Leaf node is full");
  }

  leaf.setKey(m_cellNum, key);
  serialise(row, leaf.value(m_cellNum));
  leaf.setNumCells(numCells + 1);

  m_cellNum++;
  m_endOfTable = true;
}

void Cursor::advance()
{
  if (m_endOfTable)
    return;

  LeafNode leaf = node();
  m_cellNum++;
  if (m_cellNum >= leaf.numCells())
  {
    m_endOfTable = true;
  }
}
