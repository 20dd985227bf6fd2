#pragma once

#include "core/vector.h"
#include "vm/object.h"
#include "vm/string.h"

// Arena owning every heap object of one interpretation. Objects are named by
// ObjRef handles; released slots go on an intrusive free list and bump their
// generation so stale handles resolve to nullptr. Nothing is collected
// automatically: whatever is still live is freed with the arena.
class Heap {
public:
    Heap() = default;
    ~Heap();

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    ObjRef create_string(const char* chars, int32_t length);
    ObjRef create_string(std::string_view str) {
        return create_string(str.data(), (int32_t)str.size());
    }

    // Both handles must name live strings.
    ObjRef concat_strings(ObjRef a, ObjRef b);

    Obj* get(ObjRef ref) const;
    ObjString* get_string(ObjRef ref) const;

    bool is_live(ObjRef ref) const { return get(ref) != nullptr; }

    // Frees the object and recycles its slot. Releasing a stale handle is a no-op.
    void release(ObjRef ref);

    int32_t live_count() const { return m_live_count; }
    int32_t slot_count() const { return m_slots.ssize(); }

private:
    ObjRef insert(Obj* obj);

    struct Slot {
        Obj* obj;
        uint32_t generation;
        int32_t next_free;
    };

    Vector<Slot> m_slots;
    int32_t m_free_head = -1;
    int32_t m_live_count = 0;
};
