#pragma once

#include "ndl-core/common.hh"
#include "ndl-core/object.hh"

namespace ndl {

    // structural: equal values always hash equally
    Word hash_value(OBJECT v);

    // structural equality; values of different kinds are never equal
    bool values_equal(OBJECT a, OBJECT b);

}   // namespace ndl
