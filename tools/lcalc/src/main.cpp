// tools/lcalc/src/main.cpp
#include "cli/Options.hpp"
#include "driver/Runner.hpp"
#include <lcalc/Version.hpp>

#include <iostream>


int main(int argc, char** argv) {
    if (argc <= 1) {
        std::cerr << lcalc::k_version_string << "\n";
        lcalc::cli::print_usage(std::cerr);
        return 1;
    }

    const auto opt = lcalc::cli::parse_options(argc, argv);

    if (!opt.ok) {
        std::cerr << "error: " << opt.error << "\n";
        lcalc::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == lcalc::cli::Mode::kVersion) {
        std::cout << lcalc::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == lcalc::cli::Mode::kUsage) {
        lcalc::cli::print_usage(std::cout);
        return 0;
    }

    return lcalc::driver::run(opt);
}
