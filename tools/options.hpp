#pragma once

#include <ostream>
#include <string>

#include "config.hpp"

// Parses a number with an optional k, M or G suffix ("2.4M" is 2400000).
// Throws std::invalid_argument.
double parse_num(const std::string& text);

// Parses sdrkit-stream's command line. Throws std::invalid_argument on
// unknown options, bad numbers, or when not exactly one of -r/-t is given.
Config parse_options(int argc, char** argv);

void show_usage(std::ostream& os, const char* progname);
