#include "file.h"

#include "log.h"

#include <cstdio>
#include <cstring>

bool read_file_to_buf(const char* path, std::string& buf) {
    FILE* file = fopen(path, "rb");
    if (file == nullptr) {
        log_error("Could not open {}", path);
        return false;
    }

    if (fseek(file, 0L, SEEK_END) != 0) {
        fclose(file);
        return false;
    }
    long file_size = ftell(file);
    if (file_size < 0) {
        fclose(file);
        return false;
    }
    rewind(file);

    buf.resize((size_t)file_size);
    size_t bytes_read = file_size > 0 ? fread(&buf[0], sizeof(char), (size_t)file_size, file) : 0;
    fclose(file);
    if (bytes_read < (size_t)file_size) {
        log_error("Could only read {} of {} bytes from {}", bytes_read, file_size, path);
        buf.clear();
        return false;
    }
    return true;
}

ReadLineResult read_line(FILE* in, char* buf, int size) {
    if (fgets(buf, size, in) == nullptr) {
        buf[0] = '\0';
        return ReadLineResult::Eof;
    }

    // No newline in the buffer: either the input ended or the line was cut off.
    if (buf[strcspn(buf, "\n")] != '\n') {
        int c = fgetc(in);
        if (c != '\n' && c != EOF) {
            while ((c = fgetc(in)) != '\n' && c != EOF) {}
            buf[0] = '\0';
            return ReadLineResult::TooLong;
        }
    }

    buf[strcspn(buf, "\r\n")] = '\0';
    return ReadLineResult::Ok;
}
