#include "../h/cli.h"
#include <iostream>

int main(int argc, char** argv) {
    return CLI::run(argc, argv, std::cout, std::cerr);
}
