#include "database/pages/leaf.hpp"

NodeType Node::type() const
{
  return static_cast<NodeType>(readLittleu8(m_page.slice(NODE_TYPE_OFFSET, NODE_TYPE_SIZE)));
}

void Node::setType(NodeType type)
{
  writeLittleu8(m_page.slice(NODE_TYPE_OFFSET, NODE_TYPE_SIZE), static_cast<u8>(type));
}

bool Node::isRoot() const
{
  return readLittleu8(m_page.slice(IS_ROOT_OFFSET, IS_ROOT_SIZE)) != 0;
}

void Node::setRoot(bool isRoot)
{
  writeLittleu8(m_page.slice(IS_ROOT_OFFSET, IS_ROOT_SIZE), isRoot ? 1 : 0);
}

PageId Node::parent() const
{
  return readLittleu32(m_page.slice(PARENT_POINTER_OFFSET, PARENT_POINTER_SIZE));
}

void Node::setParent(PageId parent)
{
  writeLittleu32(m_page.slice(PARENT_POINTER_OFFSET, PARENT_POINTER_SIZE), parent);
}

void LeafNode::initialise()
{
  setType(NodeType::Leaf);
  setRoot(true);
  setParent(0);
  setNumCells(0);
}

u32 LeafNode::numCells() const
{
  return readLittleu32(m_page.slice(LEAF_NODE_NUM_CELLS_OFFSET, LEAF_NODE_NUM_CELLS_SIZE));
}

void LeafNode::setNumCells(u32 numCells)
{
  writeLittleu32(m_page.slice(LEAF_NODE_NUM_CELLS_OFFSET, LEAF_NODE_NUM_CELLS_SIZE), numCells);
}

std::span<std::byte> LeafNode::cell(u32 cellNum)
{
  return m_page.slice(cellOffset(cellNum), LEAF_NODE_CELL_SIZE);
}

u32 LeafNode::key(u32 cellNum) const
{
  return readLittleu32(m_page.slice(cellOffset(cellNum) + LEAF_NODE_KEY_OFFSET, LEAF_NODE_KEY_SIZE));
}

void LeafNode::setKey(u32 cellNum, u32 key)
{
  writeLittleu32(cell(cellNum).subspan(LEAF_NODE_KEY_OFFSET, LEAF_NODE_KEY_SIZE), key);
}

std::span<std::byte> LeafNode::value(u32 cellNum)
{
  return cell(cellNum).subspan(LEAF_NODE_VALUE_OFFSET, LEAF_NODE_VALUE_SIZE);
}

std::span<const std::byte> LeafNode::value(u32 cellNum) const
{
  return m_page.slice(cellOffset(cellNum) + LEAF_NODE_VALUE_OFFSET, LEAF_NODE_VALUE_SIZE);
}
