#include <iostream>
#include <vector>
#include <string>
#include "cli/probe_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        ProbeCLI cli(std::cout, std::cerr);
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_IO;
    }
}
