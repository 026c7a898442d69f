#ifndef SOURCER_OPTIONS_H
#define SOURCER_OPTIONS_H

#include <unistd.h>

#include <cstdio>
#include <string>
#include <vector>

namespace sourcer {

struct Options {
    std::string label = "source";
    std::string interpreter = "bash";

    std::vector<std::string> templates;
    std::vector<std::string> args;

    bool default_path = true;
    bool path_search = false;
    bool print = false;
    bool verbose = false;

    bool colorize = isatty(fileno(stderr));
};

extern Options g_options;

} // namespace sourcer

#endif
