#include "app/WordIndexApp.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return runWordIndex(argv[0], args, std::cout, std::cerr);
}
