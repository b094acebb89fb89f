#include "repl/statement.hpp"

#include <charconv>
#include <sstream>
#include <vector>

namespace
{

bool startsWith(const std::string &s, const char *prefix)
{
  return s.rfind(prefix, 0) == 0;
}

PrepareResult prepareInsert(const std::string &input, Statement &statement)
{
  std::istringstream words(input);
  std::vector<std::string> parts;
  for (std::string word; words >> word;)
  {
    parts.push_back(word);
  }

  if (parts.size() != 4)
  {
    return PrepareResult::SyntaxError;
  }

  const std::string &idText = parts[1];
  if (startsWith(idText, "-"))
  {
    return PrepareResult::NegativeId;
  }

  u32 id = 0;
  const char *first = idText.data();
  const char *last = idText.data() + idText.size();
  const auto [end, ec] = std::from_chars(first, last, id);
  if (ec != std::errc() || end != last)
  {
    return PrepareResult::SyntaxError;
  }

  if (parts[2].size() > COLUMN_USERNAME_SIZE || parts[3].size() > COLUMN_EMAIL_SIZE)
  {
    return PrepareResult::StringTooLong;
  }

  statement.type = StatementType::Insert;
  statement.rowToInsert = Row{id, parts[2], parts[3]};
  return PrepareResult::Success;
}

} // namespace

PrepareResult prepareStatement(const std::string &input, Statement &statement)
{
  if (startsWith(input, "insert"))
  {
    return prepareInsert(input, statement);
  }
  if (startsWith(input, "select"))
  {
    statement.type = StatementType::Select;
    return PrepareResult::Success;
  }

  return PrepareResult::UnrecognizedStatement;
}

ExecuteResult executeStatement(const Statement &statement, Table &table, std::ostream &out)
{
  switch (statement.type)
  {
  case StatementType::Insert:
    return table.insert(statement.rowToInsert);
  case StatementType::Select:
    for (const Row &row : table.scan())
    {
      printRow(row, out);
    }
    return ExecuteResult::Success;
  }

  return ExecuteResult::Success;
}

MetaCommandResult doMetaCommand(const std::string &input, Table &table, std::ostream &out)
{
  if (input == ".exit")
  {
    return MetaCommandResult::Exit;
  }
  if (input == ".constants")
  {
    printConstants(out);
    return MetaCommandResult::Success;
  }
  if (input == ".btree")
  {
    out << "Tree:" << std::endl;
    printLeafNode(LeafNode(table.pager().getPage(table.rootPageNum())), out);
    return MetaCommandResult::Success;
  }

  return MetaCommandResult::UnrecognizedCommand;
}

void printPrepareError(PrepareResult result, const std::string &input, std::ostream &out)
{
  switch (result)
  {
  case PrepareResult::Success:
    return;
  case PrepareResult::UnrecognizedStatement:
    out << "unrecognized keyword at start of '" << input << "'." << std::endl;
    return;
  case PrepareResult::SyntaxError:
    out << "syntax error. could not parse statement." << std::endl;
    return;
  case PrepareResult::StringTooLong:
    out << "string is too long." << std::endl;
    return;
  case PrepareResult::NegativeId:
    // ids are unsigned, so a negative one does not parse
    out << "syntax error. id must be positive." << std::endl;
    return;
  }
}

void printRow(const Row &row, std::ostream &out)
{
  out << "(" << row.id << ", " << row.username << ", " << row.email << ")" << std::endl;
}

void printConstants(std::ostream &out)
{
  out << "Constants:" << std::endl;
  out << "ROW_SIZE: " << ROW_SIZE << std::endl;
  out << "COMMON_NODE_HEADER_SIZE: " << COMMON_NODE_HEADER_SIZE << std::endl;
  out << "LEAF_NODE_HEADER_SIZE: " << LEAF_NODE_HEADER_SIZE << std::endl;
  out << "LEAF_NODE_CELL_SIZE: " << LEAF_NODE_CELL_SIZE << std::endl;
  out << "LEAF_NODE_SPACE_FOR_CELLS: " << LEAF_NODE_SPACE_FOR_CELLS << std::endl;
  out << "LEAF_NODE_MAX_CELLS: " << LEAF_NODE_MAX_CELLS << std::endl;
}

void printLeafNode(const LeafNode &leaf, std::ostream &out)
{
  const u32 numCells = leaf.numCells();
  out << "leaf (size " << numCells << ")" << std::endl;
  for (u32 i = 0; i < numCells; i++)
  {
    out << "  - " << i << " : " << leaf.key(i) << std::endl;
  }
}
