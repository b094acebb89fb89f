#include "database/table.hpp"

#include <sstream>

Table::Table(const std::filesystem::path &path)
: m_pager(path)
{
  initialiseRoot();
}

Table::Table(std::iostream &stream)
: m_pager(stream)
{
  initialiseRoot();
}

Table::~Table()
{
  if (!isOpen())
    return;

  try
  {
    close();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to close table: " << e.what() << std::endl;
  }
}

void Table::initialiseRoot()
{
  if (m_pager.numPages() == 0)
  {
    // new database file, page 0 is the root leaf
    LeafNode root(m_pager.getPage(m_rootPageNum));
    root.initialise();
    return;
  }

  LeafNode root(m_pager.getPage(m_rootPageNum));
  if (root.numCells() > LEAF_NODE_MAX_CELLS)
  {
    std::ostringstream ss;
    ss << "Root page has " << root.numCells() << " cells, more than the " << LEAF_NODE_MAX_CELLS
       << " a leaf can hold. Corrupt file.";
    throw FormatError(ss.str());
  }
}

ExecuteResult Table::insert(const Row &row)
{
  LeafNode root(m_pager.getPage(m_rootPageNum));
  if (root.isFull())
  {
    return ExecuteResult::TableFull;
  }

  Cursor cursor = Cursor::end(*this);
  cursor.insert(row.id, row);
  return ExecuteResult::Success;
}

RowScan Table::scan(DecodeMode mode)
{
  return RowScan(*this, mode);
}

void Table::close()
{
  try
  {
    for (PageId i = 0; i < m_pager.numPages(); i++)
    {
      m_pager.flushPage(i);
    }
  }
  catch (const PageError &)
  {
    // the table is closed either way, a failed close is not retried
    m_pager.release();
    throw;
  }
  m_pager.close();
}

RowScan::iterator RowScan::begin() { return iterator(Cursor::start(*m_table), m_mode); }
RowScan::iterator RowScan::end() { return iterator(); }

RowScan::iterator::iterator(Cursor cursor, DecodeMode mode)
    : m_cursor(cursor), m_mode(mode), m_isEnd(cursor.isEnd())
{
  read();
}

void RowScan::iterator::read()
{
  if (m_isEnd)
    return;

  m_current = deserialise(m_cursor->value(), m_mode);
}

RowScan::iterator &RowScan::iterator::operator++()
{
  if (m_isEnd || !m_cursor)
    return *this;

  m_cursor->advance();
  if (m_cursor->isEnd())
  {
    m_isEnd = true;
  }
  else
  {
    read();
  }

  return *this;
}

RowScan::iterator RowScan::iterator::operator++(int)
{
  iterator tmp = *this;
  ++(*this);
  return tmp;
}
