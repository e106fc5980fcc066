#include "ndl-core/refcount.hh"

#include <sstream>
#include <vector>

#include "ndl-core/feedback.hh"

namespace ndl {

    void retain(Heap& heap, OBJECT v, size_t amount) {
        if (!v.is_ptr()) {
            // validates the tag
            v.kind();
            return;
        }
        HeapObject object = heap.checked(v);
        if (!object.is_reference_counted()) {
            return;
        }
        object.set_refcount(object.refcount() + amount);
    }

    static void push_children(HeapObject object, std::vector<OBJECT>& worklist) {
        switch (object.kind()) {
            case HeapKind::Int:
            case HeapKind::Text:
            case HeapKind::ForeignId: {
            } break;
            case HeapKind::Tag: {
                auto value = HeapTag(object.address()).value();
                if (value.has_value()) {
                    worklist.push_back(*value);
                }
            } break;
            case HeapKind::Function: {
                HeapFunction function{object.address()};
                for (size_t i = 0; i < function.captured_count(); i++) {
                    worklist.push_back(function.captured(i));
                }
            } break;
            case HeapKind::List: {
                HeapList list{object.address()};
                for (size_t i = 0; i < list.len(); i++) {
                    worklist.push_back(list.get(i));
                }
            } break;
            case HeapKind::Struct: {
                HeapStruct s{object.address()};
                for (size_t i = 0; i < s.len(); i++) {
                    worklist.push_back(s.key(i));
                    worklist.push_back(s.value(i));
                }
            } break;
        }
    }

    void release(Heap& heap, OBJECT v) {
        if (!v.is_ptr()) {
            v.kind();
            return;
        }

        // fast path: no object is freed
        HeapObject first = heap.checked(v);
        if (!first.is_reference_counted()) {
            return;
        }
        if (first.refcount() > 1) {
            first.set_refcount(first.refcount() - 1);
            return;
        }

        // slow path: free iteratively so deep structures cannot overflow the native stack
        std::vector<OBJECT> worklist;
        worklist.push_back(v);
        while (!worklist.empty()) {
            OBJECT it = worklist.back();
            worklist.pop_back();
            if (!it.is_ptr()) {
                it.kind();
                continue;
            }
            HeapObject object = heap.checked(it);
            if (!object.is_reference_counted()) {
                continue;
            }
            if (object.refcount() == 0) {
                std::stringstream ss;
                ss << "Reference count underflow on " << heap_kind_name(object.kind()) << " at " << object.address();
                error(ss.str());
                throw FatalError();
            }
            if (object.refcount() > 1) {
                object.set_refcount(object.refcount() - 1);
                continue;
            }
            push_children(object, worklist);
            heap.deallocate(object);
        }
    }

}   // namespace ndl
