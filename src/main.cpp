#include <iostream>
#include <vector>
#include <string>
#include <core/constants.hpp>
#include "cli/rpctl_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        RpctlCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);
        return cli.execute(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_ERROR;
    }
}
