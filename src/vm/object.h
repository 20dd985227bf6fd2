#pragma once

#include <cstdint>

enum ObjType : uint8_t {
    OBJ_STRING
};

struct Obj {
    ObjType type;

    explicit Obj(ObjType type_) : type(type_) {}
};

// Handle to a heap arena slot. The generation detects handles that outlive
// the object they were created for.
struct ObjRef {
    uint32_t index;
    uint32_t generation;
};

inline bool operator==(ObjRef a, ObjRef b) {
    return a.index == b.index && a.generation == b.generation;
}

inline bool operator!=(ObjRef a, ObjRef b) {
    return !(a == b);
}

void free_object(Obj* obj);
