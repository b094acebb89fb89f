#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "database/cursor.hpp"
#include "database/table.hpp"

TEST(Cursor, StartOfEmptyTableIsEnd) {
  std::stringstream ss;
  Table table(ss);
  Cursor cursor = Cursor::start(table);
  EXPECT_TRUE(cursor.isEnd());
  EXPECT_EQ(0u, cursor.cellNum());
  EXPECT_EQ(table.rootPageNum(), cursor.pageNum());
  EXPECT_THROW(cursor.value(), std::out_of_range);
}

TEST(Cursor, EndIsAfterLastCell) {
  std::stringstream ss;
  Table table(ss);
  ASSERT_EQ(ExecuteResult::Success, table.insert(Row{1, "a", "a@a"}));
  ASSERT_EQ(ExecuteResult::Success, table.insert(Row{2, "b", "b@b"}));

  Cursor cursor = Cursor::end(table);
  EXPECT_TRUE(cursor.isEnd());
  EXPECT_EQ(2u, cursor.cellNum());
}

TEST(Cursor, InsertAppends) {
  std::stringstream ss;
  Table table(ss);

  Cursor cursor = Cursor::end(table);
  cursor.insert(9, Row{9, "nine", "nine@example.com"});
  EXPECT_EQ(1u, cursor.cellNum());
  EXPECT_TRUE(cursor.isEnd());

  LeafNode root(table.pager().getPage(table.rootPageNum()));
  EXPECT_EQ(1u, root.numCells());
  EXPECT_EQ(9u, root.key(0));
}

TEST(Cursor, InsertOnlyAtEnd) {
  std::stringstream ss;
  Table table(ss);
  ASSERT_EQ(ExecuteResult::Success, table.insert(Row{1, "a", "a@a"}));

  Cursor cursor = Cursor::start(table);
  EXPECT_THROW(cursor.insert(2, Row{2, "b", "b@b"}), std::logic_error);
}

/* walk every cell in insertion order then stop */
TEST(Cursor, Advance) {
  std::stringstream ss;
  Table table(ss);
  for (u32 id : {30u, 10u, 20u})
  {
    ASSERT_EQ(ExecuteResult::Success, table.insert(Row{id, "user", "user@example.com"}));
  }

  Cursor cursor = Cursor::start(table);
  std::vector<u32> keys;
  while (!cursor.isEnd())
  {
    keys.push_back(cursor.key());
    EXPECT_EQ(cursor.key(), deserialise(cursor.value()).id);
    cursor.advance();
  }
  EXPECT_EQ((std::vector<u32>{30, 10, 20}), keys);
  EXPECT_EQ(3u, cursor.cellNum());

  // advancing at the end stays put
  cursor.advance();
  EXPECT_TRUE(cursor.isEnd());
  EXPECT_EQ(3u, cursor.cellNum());
}
