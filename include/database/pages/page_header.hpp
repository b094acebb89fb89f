#pragma once

#include "machine.hpp"

using PageId = u32;
const u32 PAGE_SIZE = 4096;
const u32 TABLE_MAX_PAGES = 100;

// stored in the first byte of every node page
enum NodeType : u8
{
  Interior = 0, // reserved until nodes can split
  Leaf = 1,
};

/*
 * Common node header, at the start of every node page
 * | type (1) | is root (1) | parent (4) |
 */
const u32 NODE_TYPE_SIZE = sizeof(u8);
const u32 NODE_TYPE_OFFSET = 0;
const u32 IS_ROOT_SIZE = sizeof(u8);
const u32 IS_ROOT_OFFSET = NODE_TYPE_OFFSET + NODE_TYPE_SIZE;
const u32 PARENT_POINTER_SIZE = sizeof(PageId);
const u32 PARENT_POINTER_OFFSET = IS_ROOT_OFFSET + IS_ROOT_SIZE;
const u32 COMMON_NODE_HEADER_SIZE = NODE_TYPE_SIZE + IS_ROOT_SIZE + PARENT_POINTER_SIZE;
