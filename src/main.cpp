#include "sheetpress/app/CommandLine.hpp"
#include <iostream>

int main(int argc, char* argv[])
{
    sheetpress::app::CommandLine command_line(std::cout, std::cerr);
    return command_line.run(argc, argv);
}
