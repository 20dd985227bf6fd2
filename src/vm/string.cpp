#include "vm/string.h"

#include <cstring>
#include <cstddef>
#include <cstdlib>
#include <new>

uint32_t hash_string(const char *key, int32_t length) {
    uint32_t hash = 2166136261u;
    for (int32_t i = 0; i < length; i++) {
        hash ^= (uint8_t)key[i];
        hash *= 16777619;
    }
    return hash;
}

static ObjString *allocate_obj_string(int32_t length) {
    void* raw_data = malloc(sizeof(ObjString) + (size_t)length + 1);
    if (raw_data == nullptr) {
        throw std::bad_alloc();
    }
    auto str = new (raw_data) ObjString();
    str->length = length;
    str->chars[length] = 0;
    return str;
}

ObjString *create_obj_string(const char *chars, int32_t length) {
    auto str = allocate_obj_string(length);
    if (length > 0) memcpy(str->chars, chars, (size_t)length);
    str->hash = hash_string(str->chars, length);
    return str;
}

ObjString* concat_obj_strings(const ObjString* a, const ObjString* b) {
    int32_t length = a->length + b->length;
    auto result = allocate_obj_string(length);
    memcpy(result->chars, a->chars, (size_t)a->length);
    memcpy(result->chars + a->length, b->chars, (size_t)b->length);
    result->hash = hash_string(result->chars, length);
    return result;
}

void free_obj_string(ObjString* str) {
    str->~ObjString();
    free(str);
}

bool obj_strings_equal(const ObjString* a, const ObjString* b) {
    return a->length == b->length &&
           a->hash == b->hash &&
           memcmp(a->chars, b->chars, (size_t)a->length) == 0;
}
