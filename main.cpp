#include <exception>
#include <iostream>

#include "cli.h"

int main(int argc, char* argv[]) {
    try {
        CLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cout.flush();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
