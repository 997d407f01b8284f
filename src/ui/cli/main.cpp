#include "CommandLine.hpp"
#include "ConsoleUtils.hpp"
#include "keyhop/log/Registry.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv)
{
    try
    {
        if (!keyhop::ui::cli::lockProcessMemory())
        {
            keyhop::log::Registry::keyhop()->debug("memory locking unavailable, continuing without it");
        }

        std::vector<std::string> args(argv, argv + argc);
        keyhop::ui::cli::CommandLine commandLine{ std::cin, std::cout, std::cerr, keyhop::ui::cli::readSecret };
        return commandLine.run(args);
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
