#include <exception>
#include <iostream>

#include "execbox/cli/app.hpp"

int main(int argc, char** argv) {
    try {
        execbox::cli::App app;
        return app.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "execbox: fatal: " << e.what() << "\n";
        return 1;
    }
}
