#include <iostream>

#include "logger/logger.hpp"
#include "options.hpp"
#include "printer.hpp"
#include "shell.hpp"

int main(int argc, char *argv[])
{
    using namespace Subnetter::Cli;

    Operation op;

    try
    {
        op = readArguments(argc, argv);
    }
    catch (std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    const Palette palette(op.color);
    bool result = true;

    switch (op.type)
    {
    case EOperationType::Help:
        return 0;
    case EOperationType::Interactive:
        Shell(std::cin, std::cout, palette).run();
        break;
    case EOperationType::SingleNetwork:
        result = reportNetwork(std::cout, op.network, palette);
        break;
    case EOperationType::Allocate:
        result = planNetwork(std::cout, op.network, op.host_counts, palette);
        break;
    }

    SUBNETTER_DBG_LOG("Exiting...");

    return !result;
}
