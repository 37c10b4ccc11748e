// config_file.cpp
//
// Builds a console from a JSON configuration file and prints exceptions
// through the error sink.
//
// Usage: config_file [config.json]

#include "prism_con.hpp"
#include <cstdio>
#include <stdexcept>

static void loadDataset() {
    try {
        throw std::runtime_error("dataset.bin: unexpected end of file");
    } catch (...) {
        std::throw_with_nested(std::runtime_error("failed to load dataset"));
    }
}

int main(int argc, char **argv) {
    prism::ConsoleOptions options;
    if (argc > 1) {
        try {
            options = prism::ConsoleOptions::fromFile(argv[1]);
        } catch (const std::exception &e) {
            std::fprintf(stderr, "bad configuration: %s\n", e.what());
            return 1;
        }
    }
    options.applyEnvironment();

    prism::Console console(options);
    console.log();
    console.print(" configured with prefix '" + options.prefix_ + "'\n");

    try {
        loadDataset();
    } catch (...) {
        prism::printException(console, "Dataset");
    }
    return 0;
}
