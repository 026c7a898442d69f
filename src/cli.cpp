#include <string>
#include <utility>

#include <fmt/core.h>

#include "sourcer/dispatcher.h"
#include "sourcer/log.h"

#include "sourcer/cli.h"

#include "version.h"

namespace sourcer {

void version() {
    fmt::print("sourcer v{}.{}\n", SOURCER_VERSION_MAJOR, SOURCER_VERSION_MINOR);
}

void help() {
    fmt::print(R"(USAGE: sourcer [options] name [args...]

OPTIONS:
  -h, --help                Print this help message and exit
  -V, --version             Print sourcer version and exit
  -d, --dot                 Report diagnostics as `.` instead of `source`
  -p, --print               Print the resolved path instead of loading it
  -x, --interpreter <prog>  Interpreter used to load the script (default: bash)
  -I <template>             Append a search path template (must contain %s)
  --no-default-path         Start from an empty search path
  --path-search             Also search directories listed in $PATH
  --color                   Force colored output
  --no-color                Disable colored output
  -v, --verbose             Use verbose output
  --                        End of options

ENVIRONMENT:
  SOURCE_PATH               Colon-separated templates replacing the defaults
)");
}

std::optional<int> parse_args(std::span<char*> args, Options& options) {
    bool expecting_interpreter = false;
    bool expecting_template = false;

    bool parsing_script_args = false;

    for (const char* arg_cstr : args.subspan(1)) {
        std::string arg = arg_cstr;

        if (parsing_script_args) {
            options.args.push_back(std::move(arg));
            continue;
        }

        if (expecting_interpreter) {
            options.interpreter = arg;
            expecting_interpreter = false;
            continue;
        }

        if (expecting_template) {
            options.templates.push_back(std::move(arg));
            expecting_template = false;
            continue;
        }

        if (arg == "-h" || arg == "--help") {
            help();
            return 0;
        }

        if (arg == "-V" || arg == "--version") {
            version();
            return 0;
        }

        if (arg == "-d" || arg == "--dot") {
            options.label = dot_label;
            continue;
        }

        if (arg == "-p" || arg == "--print") {
            options.print = true;
            continue;
        }

        if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
            continue;
        }

        if (arg == "--no-default-path") {
            options.default_path = false;
            continue;
        }

        if (arg == "--path-search") {
            options.path_search = true;
            continue;
        }

        if (arg == "--color") {
            options.colorize = true;
            continue;
        }

        if (arg == "--no-color") {
            options.colorize = false;
            continue;
        }

        if (arg == "-x" || arg == "--interpreter") {
            expecting_interpreter = true;
            continue;
        }

        if (arg == "-I") {
            expecting_template = true;
            continue;
        }

        if (arg == "--") {
            parsing_script_args = true;
            continue;
        }

        if (arg.starts_with('-') && arg != "-") {
            log::error("unrecognized option: {}", log::quoted(arg));
            return usage_status;
        }

        // The module name; everything after it belongs to the script.
        options.args.push_back(std::move(arg));
        parsing_script_args = true;
    }

    if (expecting_interpreter) {
        log::error("missing interpreter");
        return usage_status;
    }

    if (expecting_template) {
        log::error("missing search path template");
        return usage_status;
    }

    return std::nullopt;
}

} // namespace sourcer
