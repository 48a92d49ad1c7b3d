#include "memescalate/cli/arg_parser.hpp"
#include "memescalate/cli/cli_app.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

int main(int argc, char** argv)
{
    try
    {
        memescalate::CommandLine line = memescalate::parse_command_line(argc, argv);
        memescalate::CliApp app(std::cout);
        int status = app.run(line);
        std::cout << std::flush;
        return status;
    }
    catch (const std::exception& e)
    {
        std::cout << std::flush;
        std::cerr << "Error: " << e.what() << "\n" << std::flush;
        return EXIT_FAILURE;
    }
}
