#include "vm/object.h"

#include "vm/string.h"

void free_object(Obj* obj) {
    switch (obj->type) {
        case OBJ_STRING: {
            free_obj_string(reinterpret_cast<ObjString*>(obj));
            break;
        }
    }
}
