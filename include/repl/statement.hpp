#pragma once

#include "database/pages/leaf.hpp"
#include "database/table.hpp"

#include <ostream>
#include <string>

enum class StatementType
{
  Insert,
  Select,
};

struct Statement
{
  StatementType type = StatementType::Select;
  Row rowToInsert;
};

enum class PrepareResult
{
  Success,
  UnrecognizedStatement,
  SyntaxError,
  StringTooLong,
  NegativeId,
};

enum class MetaCommandResult
{
  Success,
  Exit,
  UnrecognizedCommand,
};

// parse a line into a statement. `statement` is only set on success
[[nodiscard]] PrepareResult prepareStatement(const std::string &input, Statement &statement);
[[nodiscard]] ExecuteResult executeStatement(const Statement &statement, Table &table, std::ostream &out);

// handle a line starting with '.'
[[nodiscard]] MetaCommandResult doMetaCommand(const std::string &input, Table &table, std::ostream &out);

// the message for a statement that failed to prepare
void printPrepareError(PrepareResult result, const std::string &input, std::ostream &out);

void printRow(const Row &row, std::ostream &out);
void printConstants(std::ostream &out);
void printLeafNode(const LeafNode &leaf, std::ostream &out);
