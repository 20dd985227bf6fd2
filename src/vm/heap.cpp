#include "vm/heap.h"

#include "core/log.h"

Heap::~Heap() {
    for (Slot& slot : m_slots) {
        if (slot.obj != nullptr) {
            free_object(slot.obj);
            slot.obj = nullptr;
        }
    }
}

ObjRef Heap::insert(Obj* obj) {
    m_live_count++;
    if (m_free_head != -1) {
        int32_t index = m_free_head;
        Slot& slot = m_slots[index];
        m_free_head = slot.next_free;
        slot.obj = obj;
        slot.next_free = -1;
        return {(uint32_t)index, slot.generation};
    }

    if (m_slots.size() == m_slots.capacity()) {
        log_trace("Heap arena growing past {} slots", m_slots.size());
    }
    m_slots.push_back({obj, 0, -1});
    return {m_slots.size() - 1, 0};
}

ObjRef Heap::create_string(const char* chars, int32_t length) {
    ObjString* str = create_obj_string(chars, length);
    return insert(&str->obj);
}

ObjRef Heap::concat_strings(ObjRef a, ObjRef b) {
    ObjString* lhs = get_string(a);
    ObjString* rhs = get_string(b);
    log_assert(lhs != nullptr && rhs != nullptr, "concat_strings on a stale or non-string handle");
    ObjString* str = concat_obj_strings(lhs, rhs);
    return insert(&str->obj);
}

Obj* Heap::get(ObjRef ref) const {
    if (ref.index >= m_slots.size()) return nullptr;
    const Slot& slot = m_slots[ref.index];
    if (slot.generation != ref.generation) return nullptr;
    return slot.obj;
}

ObjString* Heap::get_string(ObjRef ref) const {
    Obj* obj = get(ref);
    if (obj == nullptr || obj->type != OBJ_STRING) return nullptr;
    return reinterpret_cast<ObjString*>(obj);
}

void Heap::release(ObjRef ref) {
    Obj* obj = get(ref);
    if (obj == nullptr) return;

    Slot& slot = m_slots[ref.index];
    free_object(obj);
    slot.obj = nullptr;
    slot.generation++;
    slot.next_free = m_free_head;
    m_free_head = (int32_t)ref.index;
    m_live_count--;
}
