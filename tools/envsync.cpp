#include <iostream>
#include "envsync/cli.hpp"

int main(int argc, char** argv){
    return envsync::run_cli(argc, argv, std::cout, std::cerr);
}
