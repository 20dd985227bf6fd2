#pragma once

#include "vm/object.h"

#include <cstdint>
#include <string_view>

struct ObjString {
    Obj obj;
    int32_t length;
    uint32_t hash;
    char chars[];

    ObjString() : obj(OBJ_STRING) {}

    std::string_view view() const { return std::string_view(chars, (size_t)length); }
};

uint32_t hash_string(const char *key, int32_t length);

ObjString* create_obj_string(const char* chars, int32_t length);

ObjString* concat_obj_strings(const ObjString* a, const ObjString* b);

void free_obj_string(ObjString* str);

bool obj_strings_equal(const ObjString* a, const ObjString* b);
