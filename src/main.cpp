#include "core/array.h"
#include "core/file.h"
#include "core/log.h"
#include "options.h"
#include "vm/vm.h"

#include <fmt/core.h>

#include <cstring>

#define EX_USAGE    (64)    // incorrect command-line usage
#define EX_DATAERR  (65)    // compile errors
#define EX_SOFTWARE (70)    // runtime errors
#define EX_IOERR    (74)    // I/O error

static void report_runtime_error(const RuntimeError& error) {
    fmt::print(stderr, "{}\n[line {}] in script\n", error.message, error.line);
}

static int exit_code(InterpretResult result) {
    switch (result) {
        case InterpretResult::Ok: return 0;
        case InterpretResult::CompileError: return EX_DATAERR;
        case InterpretResult::RuntimeError: return EX_SOFTWARE;
    }
    return EX_SOFTWARE;
}

static void repl(Config config) {
    Array<char, 1024> line;
    for (;;) {
        fmt::print("> ");
        fflush(stdout);
        ReadLineResult read = read_line(stdin, line.data(), line.size());
        if (read == ReadLineResult::Eof) {
            fmt::print("\n");
            break;
        }
        if (read == ReadLineResult::TooLong) {
            fmt::print(stderr, "Line too long (at most {} characters).\n", line.size() - 1);
            continue;
        }

        if (strcmp(line.data(), "exit") == 0) {
            break;
        }
        else if (strcmp(line.data(), "tron") == 0) {
            config.trace_execution = true;
        }
        else if (strcmp(line.data(), "troff") == 0) {
            config.trace_execution = false;
        }
        else if (line[0] != '\0') {
            RuntimeError error;
            if (interpret(line.data(), config, &error) == InterpretResult::RuntimeError) {
                report_runtime_error(error);
            }
        }
    }
}

static int run_file(const char* path, const Config& config) {
    std::string source;
    if (!read_file_to_buf(path, source)) {
        fmt::print(stderr, "Could not open file \"{}\".\n", path);
        return EX_IOERR;
    }

    RuntimeError error;
    InterpretResult result = interpret(source, config, &error);
    if (result == InterpretResult::RuntimeError) {
        report_runtime_error(error);
    }
    log_debug("{} finished with exit code {}", path, exit_code(result));
    return exit_code(result);
}

static int run_expression(const std::string& expression, const Config& config) {
    std::string text;
    RuntimeError error;
    InterpretResult result = evaluate(expression, config, &text, &error);
    if (result == InterpretResult::Ok) {
        fmt::print(config.out, "{}\n", text);
    }
    else if (result == InterpretResult::RuntimeError) {
        report_runtime_error(error);
    }
    return exit_code(result);
}

int main(int argc, char* argv[]) {
    Options options;
    std::string error;
    if (!apply_environment(&options, &error) || !parse_options(argc, argv, &options, &error)) {
        fmt::print(stderr, "{}\n{}\n", error, usage_string());
        return EX_USAGE;
    }

    log_set_minimum_level(options.log_level);
    if (!options.log_file.empty() && !log_init(options.log_file.c_str())) {
        return EX_IOERR;
    }
    log_debug("trace_execution={} print_code={} log_level={}",
              options.config.trace_execution, options.config.print_code, options.log_level);

    int code = 0;
    if (options.has_expression) {
        code = run_expression(options.expression, options.config);
    }
    else if (!options.script_path.empty()) {
        code = run_file(options.script_path.c_str(), options.config);
    }
    else {
        repl(options.config);
    }

    log_release();
    return code;
}
