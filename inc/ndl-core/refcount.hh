#pragma once

#include "ndl-core/heap.hh"
#include "ndl-core/object.hh"

///
// Reference counting
// `retain` and `release` are the only operations that change a count.
// Inline values and uncounted (constant) objects are ignored by both.
//

namespace ndl {

    void retain(Heap& heap, OBJECT v, size_t amount = 1);
    void release(Heap& heap, OBJECT v);

}   // namespace ndl
