// ============================================================================
// main.cpp — Entry point for the treestrat tool
// ============================================================================

#include "treestrat/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        treestrat::Options opts = treestrat::parse_args(argc, argv);

        if (opts.help) {
            treestrat::print_usage(argv[0]);
            return 0;
        }

        return treestrat::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        treestrat::print_usage(argv[0]);
        return 1;
    }
}
