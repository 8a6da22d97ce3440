// pixunscale.cpp
// MIT License (c) 2026 Pedro

#include "commands/pixunscale_command.h"

int main(int argc, char** argv) {
    return run_pixunscale(argc, argv);
}
