/***
 * Name: pybox::main
 * Purpose: Entry point for the pybox CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: process status (0 success, 1 fragment rejected or failed, 2 usage or host error).
 */
#include <iostream>

#include "cli/App.h"

int main(int argc, char** argv) { return pybox::cli::Main(argc, argv, std::cout, std::cerr); }
