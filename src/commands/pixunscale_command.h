#pragma once

int run_pixunscale(int argc, char** argv);
