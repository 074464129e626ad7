#include "athlete_cli/cli_handler.hpp"
#include <iostream>

int main(int argc, char *argv[])
{
  try
  {
    athlete_cli::CliOptions options = athlete_cli::CliHandler::parse_arguments(argc, argv);

    athlete_cli::CliHandler handler;
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
