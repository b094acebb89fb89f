#include "repl/statement.hpp"

#include <iostream>
#include <memory>
#include <string>

void printPrompt()
{
  std::cout << "db > " << std::flush;
}

std::string trim(const std::string &s)
{
  const char *whitespace = " \t\r\n";
  const auto first = s.find_first_not_of(whitespace);
  if (first == std::string::npos)
  {
    return "";
  }
  const auto last = s.find_last_not_of(whitespace);
  return s.substr(first, last - first + 1);
}

int main(int argc, char **argv)
{
  if (argc < 2)
  {
    std::cerr << "must supply a database filename." << std::endl;
    return 1;
  }

  std::unique_ptr<Table> table;
  try
  {
    table = std::make_unique<Table>(argv[1]);
  }
  catch (const std::exception &e)
  {
    std::cerr << "error opening database: " << e.what() << std::endl;
    return 1;
  }

  std::string line;
  while (true)
  {
    printPrompt();
    if (!std::getline(std::cin, line))
    {
      break;
    }
    const std::string input = trim(line);

    try
    {
      if (input.starts_with("."))
      {
        const MetaCommandResult result = doMetaCommand(input, *table, std::cout);
        if (result == MetaCommandResult::Exit)
        {
          break;
        }
        if (result == MetaCommandResult::UnrecognizedCommand)
        {
          std::cout << "unrecognized command: " << input << std::endl;
        }
        continue;
      }

      Statement statement;
      const PrepareResult prepared = prepareStatement(input, statement);
      if (prepared != PrepareResult::Success)
      {
        printPrepareError(prepared, input, std::cout);
        continue;
      }

      switch (executeStatement(statement, *table, std::cout))
      {
      case ExecuteResult::Success:
        std::cout << "executed." << std::endl;
        break;
      case ExecuteResult::TableFull:
        std::cout << "error: Table full." << std::endl;
        break;
      }
    }
    catch (const std::exception &e)
    {
      // the statement failed but the table may still be usable
      std::cout << "error executing statement: " << e.what() << std::endl;
    }
  }

  try
  {
    table->close();
  }
  catch (const std::exception &e)
  {
    std::cerr << "error closing database: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
