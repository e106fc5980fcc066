#pragma once

#include <cstdint>
#include <optional>

#include <gmpxx.h>

#include "ndl-core/heap.hh"
#include "ndl-core/object.hh"

///
// Ints
// An Int is inline whenever it fits in 61 bits and a counted HeapInt otherwise, never both.
// All results below are canonical and owned by the caller.
//

namespace ndl {

    bool is_int(OBJECT v);
    mpz_class int_to_mpz(OBJECT v);
    std::optional<int64_t> int_to_small(OBJECT v);

    OBJECT make_int(Heap& heap, int64_t value);
    OBJECT make_int(Heap& heap, mpz_class const& value);

    OBJECT int_add(Heap& heap, OBJECT a, OBJECT b);
    OBJECT int_subtract(Heap& heap, OBJECT a, OBJECT b);
    OBJECT int_multiply(Heap& heap, OBJECT a, OBJECT b);

    // divisor must be non-zero:
    OBJECT int_divide_truncating(Heap& heap, OBJECT dividend, OBJECT divisor);
    OBJECT int_remainder(Heap& heap, OBJECT dividend, OBJECT divisor);
    OBJECT int_modulo(Heap& heap, OBJECT dividend, OBJECT divisor);

    OBJECT int_bitwise_and(Heap& heap, OBJECT a, OBJECT b);
    OBJECT int_bitwise_or(Heap& heap, OBJECT a, OBJECT b);
    OBJECT int_bitwise_xor(Heap& heap, OBJECT a, OBJECT b);

    // amount must be non-negative:
    OBJECT int_shift_left(Heap& heap, OBJECT value, size_t amount);
    OBJECT int_shift_right(Heap& heap, OBJECT value, size_t amount);

    OBJECT int_bit_length(Heap& heap, OBJECT value);
    int int_compare(OBJECT a, OBJECT b);

}   // namespace ndl
