#pragma once

#include "page_header.hpp"
#include "../pager.hpp"
#include "../row.hpp"

#include <span>

/*
 * Leaf node header, after the common header
 * | num cells (4) |
 * followed by the cells, in the order they were inserted
 * | key (4) | value (ROW_SIZE) |
 */
const u32 LEAF_NODE_NUM_CELLS_SIZE = sizeof(u32);
const u32 LEAF_NODE_NUM_CELLS_OFFSET = COMMON_NODE_HEADER_SIZE;
const u32 LEAF_NODE_HEADER_SIZE = COMMON_NODE_HEADER_SIZE + LEAF_NODE_NUM_CELLS_SIZE;

const u32 LEAF_NODE_KEY_SIZE = sizeof(u32);
const u32 LEAF_NODE_KEY_OFFSET = 0;
const u32 LEAF_NODE_VALUE_SIZE = ROW_SIZE;
const u32 LEAF_NODE_VALUE_OFFSET = LEAF_NODE_KEY_OFFSET + LEAF_NODE_KEY_SIZE;
const u32 LEAF_NODE_CELL_SIZE = LEAF_NODE_KEY_SIZE + LEAF_NODE_VALUE_SIZE;
const u32 LEAF_NODE_SPACE_FOR_CELLS = PAGE_SIZE - LEAF_NODE_HEADER_SIZE;
const u32 LEAF_NODE_MAX_CELLS = LEAF_NODE_SPACE_FOR_CELLS / LEAF_NODE_CELL_SIZE;
static_assert(LEAF_NODE_MAX_CELLS > 0, "A leaf must fit at least one cell");

// view of the header every node page starts with. does not own the page
class Node
{
public:
  explicit Node(Page &page) noexcept : m_page(page) {}

  NodeType type() const;
  void setType(NodeType type);

  bool isRoot() const;
  void setRoot(bool isRoot);

  // unused until there is more than one node
  PageId parent() const;
  void setParent(PageId parent);

  bool isLeaf() const { return type() == NodeType::Leaf; }

  Page &page() noexcept { return m_page; }

protected:
  Page &m_page;
};

/* a leaf node holds the key/value cells.
 * all layout knowledge of a leaf lives here so that interior nodes can be added beside it */
class LeafNode : public Node
{
public:
  using Node::Node;

  // make an empty root leaf
  void initialise();

  u32 numCells() const;
  void setNumCells(u32 numCells);
  bool isFull() const { return numCells() >= LEAF_NODE_MAX_CELLS; }

  // only bounded by the page, the caller keeps cellNum below LEAF_NODE_MAX_CELLS
  std::span<std::byte> cell(u32 cellNum);

  u32 key(u32 cellNum) const;
  void setKey(u32 cellNum, u32 key);

  std::span<std::byte> value(u32 cellNum);
  std::span<const std::byte> value(u32 cellNum) const;

private:
  static u32 cellOffset(u32 cellNum) { return LEAF_NODE_HEADER_SIZE + cellNum * LEAF_NODE_CELL_SIZE; }
};
