#include "ndl-core/int.hh"

#include <sstream>

#include "ndl-core/feedback.hh"

namespace ndl {

    bool is_int(OBJECT v) {
        return v.is_int() || is_heap_kind(v, HeapKind::Int);
    }

    mpz_class int_to_mpz(OBJECT v) {
        if (v.is_int()) {
            return mpz_class{static_cast<long>(v.as_int())};
        }
        if (is_heap_kind(v, HeapKind::Int)) {
            return HeapInt(v.as_ptr()).to_mpz();
        }
        error("int_to_mpz: expected an Int");
        throw FatalError();
    }

    std::optional<int64_t> int_to_small(OBJECT v) {
        if (v.is_int()) {
            return {v.as_int()};
        }
        HeapInt heap_int{v.as_ptr()};
        if (mpz_fits_slong_p(heap_int.value())) {
            return {static_cast<int64_t>(mpz_get_si(heap_int.value()))};
        }
        return {};
    }

    OBJECT make_int(Heap& heap, int64_t value) {
        if (OBJECT::int_fits_inline(value)) {
            return OBJECT::make_int(value);
        }
        return HeapInt::create(heap, true, mpz_class{static_cast<long>(value)}).to_object();
    }

    OBJECT make_int(Heap& heap, mpz_class const& value) {
        if (mpz_fits_slong_p(value.get_mpz_t())) {
            return make_int(heap, static_cast<int64_t>(value.get_si()));
        }
        return HeapInt::create(heap, true, value).to_object();
    }

    OBJECT int_add(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            // |a|,|b| < 2^60 => no int64 overflow
            return make_int(heap, a.as_int() + b.as_int());
        }
        return make_int(heap, mpz_class{int_to_mpz(a) + int_to_mpz(b)});
    }

    OBJECT int_subtract(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            return make_int(heap, a.as_int() - b.as_int());
        }
        return make_int(heap, mpz_class{int_to_mpz(a) - int_to_mpz(b)});
    }

    OBJECT int_multiply(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            int64_t res;
            if (!__builtin_mul_overflow(a.as_int(), b.as_int(), &res)) {
                return make_int(heap, res);
            }
        }
        mpz_class x = int_to_mpz(a);
        mpz_class y = int_to_mpz(b);
        // the product needs at most limbs(a) + limbs(b) limbs
        heap.reserve(mpz_size(x.get_mpz_t()) + mpz_size(y.get_mpz_t()), "the product of two Ints");
        return make_int(heap, mpz_class{x * y});
    }

    OBJECT int_divide_truncating(Heap& heap, OBJECT dividend, OBJECT divisor) {
        if (dividend.is_int() && divisor.is_int()) {
            return make_int(heap, dividend.as_int() / divisor.as_int());
        }
        mpz_class res;
        mpz_tdiv_q(res.get_mpz_t(), int_to_mpz(dividend).get_mpz_t(), int_to_mpz(divisor).get_mpz_t());
        return make_int(heap, res);
    }

    OBJECT int_remainder(Heap& heap, OBJECT dividend, OBJECT divisor) {
        if (dividend.is_int() && divisor.is_int()) {
            return make_int(heap, dividend.as_int() % divisor.as_int());
        }
        mpz_class res;
        mpz_tdiv_r(res.get_mpz_t(), int_to_mpz(dividend).get_mpz_t(), int_to_mpz(divisor).get_mpz_t());
        return make_int(heap, res);
    }

    OBJECT int_modulo(Heap& heap, OBJECT dividend, OBJECT divisor) {
        // floored: the result takes the divisor's sign
        mpz_class res;
        mpz_fdiv_r(res.get_mpz_t(), int_to_mpz(dividend).get_mpz_t(), int_to_mpz(divisor).get_mpz_t());
        return make_int(heap, res);
    }

    OBJECT int_bitwise_and(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            return make_int(heap, a.as_int() & b.as_int());
        }
        return make_int(heap, mpz_class{int_to_mpz(a) & int_to_mpz(b)});
    }

    OBJECT int_bitwise_or(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            return make_int(heap, a.as_int() | b.as_int());
        }
        return make_int(heap, mpz_class{int_to_mpz(a) | int_to_mpz(b)});
    }

    OBJECT int_bitwise_xor(Heap& heap, OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            return make_int(heap, a.as_int() ^ b.as_int());
        }
        return make_int(heap, mpz_class{int_to_mpz(a) ^ int_to_mpz(b)});
    }

    OBJECT int_shift_left(Heap& heap, OBJECT value, size_t amount) {
        mpz_class v = int_to_mpz(value);
        if (v == 0) {
            return OBJECT::make_int(0);
        }
        heap.reserve(mpz_size(v.get_mpz_t()) + amount / GMP_NUMB_BITS + 1, "an Int shifted left");
        mpz_class res;
        mpz_mul_2exp(res.get_mpz_t(), v.get_mpz_t(), amount);
        return make_int(heap, res);
    }

    OBJECT int_shift_right(Heap& heap, OBJECT value, size_t amount) {
        // arithmetic: rounds towards negative infinity
        mpz_class res;
        mpz_fdiv_q_2exp(res.get_mpz_t(), int_to_mpz(value).get_mpz_t(), amount);
        return make_int(heap, res);
    }

    OBJECT int_bit_length(Heap& heap, OBJECT value) {
        mpz_class v = int_to_mpz(value);
        if (v == 0) {
            return OBJECT::make_int(0);
        }
        mpz_class magnitude = abs(v);
        return make_int(heap, static_cast<int64_t>(mpz_sizeinbase(magnitude.get_mpz_t(), 2)));
    }

    int int_compare(OBJECT a, OBJECT b) {
        if (a.is_int() && b.is_int()) {
            return (a.as_int() > b.as_int()) - (a.as_int() < b.as_int());
        }
        int res = cmp(int_to_mpz(a), int_to_mpz(b));
        return (res > 0) - (res < 0);
    }

}   // namespace ndl
