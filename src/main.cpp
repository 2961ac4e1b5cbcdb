#include <iostream>
#include <string>
#include "cli/cli_args.hpp"
#include "cli/hopssh_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            HopsshCLI::print_usage();
            return EXIT_USAGE;
        }

        auto args = parse_cli_args(argc, argv);
        if (args.is_err()) {
            std::cerr << theme::fail(args.error);
            std::cerr << theme::step("Run 'hopssh --help' for usage.");
            return EXIT_USAGE;
        }

        HopsshCLI cli;
        return cli.run(args.value);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return EXIT_FAILURE_OP;
    }
}
