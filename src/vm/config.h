#pragma once

#include <cstdio>

// Everything the compiler and VM need from their host. Built by the driver;
// the core never consults the environment itself.
struct Config {
    bool trace_execution = false;   // dump stack and next instruction before each step
    bool print_code = false;        // disassemble every successfully compiled chunk

    FILE* out = stdout;     // print statements
    FILE* err = stderr;     // compile diagnostics
    FILE* trace = stdout;   // trace_execution and print_code output
};
