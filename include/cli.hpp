#pragma once

#include "slide_extractor.hpp"
#include <ostream>
#include <string>

namespace vid2slides {

struct CliOptions {
    ExtractionConfig config;
    std::string locator;
    std::string summary_file;
    bool info_only = false;
    bool show_help = false;
};

void print_usage(const char* program_name, std::ostream& out);

// Applies --config first, then every other flag over it.
// Throws ConfigError on an unknown option, a missing value, an extra
// argument or a missing locator.
CliOptions parse_arguments(int argc, char* argv[]);

// Whole command: parse, run, report. Returns the process exit status,
// 0 on success and 1 on any error.
int run_cli(int argc, char* argv[]);

} // namespace vid2slides
