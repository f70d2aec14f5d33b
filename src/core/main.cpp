#include "Console.h"
#include <iostream>

int main(int argc, char* argv[]) {
    Console console(std::cin, std::cout);
    if (!console.init(argc, argv)) {
        return 1;
    }
    console.run();
    return 0;
}
