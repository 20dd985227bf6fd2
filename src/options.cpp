#include "options.h"

#include <fmt/core.h>

#include <cstdlib>
#include <unistd.h>

const char* usage_string() {
    return "Usage: loxvm [-t] [-p] [-l level] [-e expr | path]";
}

bool apply_environment(Options* options, std::string* error) {
    if (getenv("LOX_TRACE_EXECUTION") != nullptr) {
        options->config.trace_execution = true;
    }
    if (getenv("LOX_PRINT_CODE") != nullptr) {
        options->config.print_code = true;
    }

    const char* level = getenv("LOX_LOG_LEVEL");
    if (level != nullptr && !log_parse_level(level, &options->log_level)) {
        *error = fmt::format("Unknown log level '{}' in LOX_LOG_LEVEL.", level);
        return false;
    }

    const char* log_file = getenv("LOX_LOG_FILE");
    if (log_file != nullptr && *log_file != '\0') {
        options->log_file = log_file;
    }
    return true;
}

bool parse_options(int argc, char* argv[], Options* options, std::string* error) {
    // getopt keeps global state; rewind it so the parser can run more than once.
#ifdef __GLIBC__
    optind = 0;
#else
    optind = 1;
#endif
    opterr = 0;

    int c;
    while ((c = getopt(argc, argv, ":tpl:e:")) != -1) {
        switch (c) {
        case 't':
            options->config.trace_execution = true;
            break;
        case 'p':
            options->config.print_code = true;
            break;
        case 'l':
            if (!log_parse_level(optarg, &options->log_level)) {
                *error = fmt::format("Unknown log level '{}'.", optarg);
                return false;
            }
            break;
        case 'e':
            options->expression = optarg;
            options->has_expression = true;
            break;
        case ':':
            *error = fmt::format("Option -{} requires an argument.", (char)optopt);
            return false;
        default:
            *error = fmt::format("Unknown option -{}.", (char)optopt);
            return false;
        }
    }

    int remaining = argc - optind;
    if (remaining > 1) {
        *error = "Too many arguments.";
        return false;
    }
    if (remaining == 1) {
        if (options->has_expression) {
            *error = "Cannot run a script and -e together.";
            return false;
        }
        options->script_path = argv[optind];
    }
    return true;
}
