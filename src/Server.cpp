#include "cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    // Flush after every std::cout / std::cerr
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    std::vector<std::string> args(argv, argv + argc);
    return grep::run(args, std::cin, std::cout, std::cerr);
}
