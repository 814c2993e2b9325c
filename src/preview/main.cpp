#include "preview/Preview.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return lintel::runPreview(argc, argv, std::cout, std::cerr);
}
