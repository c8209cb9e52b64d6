// hexthin.cpp
// Part of the hexprep tile preparation tools. Build with CMake.

#include "commands/command_support.h"

int main(int argc, char** argv) {
    return hexprep::commands::run_hexthin(argc, argv);
}
