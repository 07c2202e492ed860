// main.cpp
// semdiff command line tool
//
// Compares two JSON or YAML documents by meaning and prints the changes.

#include "cli.h"

#include <iostream>

int main(int argc, char** argv)
{
    return semdiff::cli::run(argc, argv, std::cin, std::cout, std::cerr);
}
