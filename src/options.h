#pragma once

#include "core/log.h"
#include "vm/config.h"

#include <string>

struct Options {
    Config config;

    int log_level = LOG_WARN;
    std::string log_file;

    std::string script_path;
    std::string expression;
    bool has_expression = false;
};

// Reads LOX_TRACE_EXECUTION, LOX_PRINT_CODE, LOX_LOG_LEVEL and LOX_LOG_FILE.
// Returns false with `error` set if LOX_LOG_LEVEL names no level.
bool apply_environment(Options* options, std::string* error);

// Parses `[-t] [-p] [-l level] [-e expr | path]` on top of whatever is already
// in `options`. Returns false with `error` set on a usage error.
bool parse_options(int argc, char* argv[], Options* options, std::string* error);

const char* usage_string();
