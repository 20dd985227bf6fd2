#pragma once

#include <cstdio>
#include <string>

// Reads the whole file at `path` into `buf`. Returns false if the file cannot
// be opened or read completely.
bool read_file_to_buf(const char* path, std::string& buf);

enum class ReadLineResult {
    Ok,
    TooLong,
    Eof
};

// Reads one line from `in` into `buf` without its line terminator. A line
// that does not fit in `size` bytes is consumed up to its newline and
// reported as TooLong; `buf` is then left empty.
ReadLineResult read_line(FILE* in, char* buf, int size);
