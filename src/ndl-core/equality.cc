#include "ndl-core/equality.hh"

#include <cstring>

#include "ndl-core/heap.hh"

namespace ndl {

    static Word hash_combine(Word seed, Word v) {
        return seed ^ (robin_hood::hash_int(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
    }

    Word hash_value(OBJECT v) {
        if (!v.is_ptr()) {
            // canonical inline encodings: the raw word identifies the value
            v.kind();
            return robin_hood::hash_int(v.as_raw());
        }
        HeapObject object{v.as_ptr()};
        switch (object.kind()) {
            case HeapKind::Int: {
                HeapInt it{v.as_ptr()};
                mpz_srcptr z = it.value();
                Word h = static_cast<Word>(mpz_sgn(z));
                for (size_t i = 0; i < mpz_size(z); i++) {
                    h = hash_combine(h, static_cast<Word>(mpz_getlimbn(z, i)));
                }
                return h;
            }
            case HeapKind::Tag: {
                HeapTag it{v.as_ptr()};
                Word h = robin_hood::hash_int(OBJECT::make_symbol(it.symbol()).as_raw());
                auto value = it.value();
                return value.has_value() ? hash_combine(h, hash_value(*value)) : h;
            }
            case HeapKind::Text: {
                std::string_view text = HeapText(v.as_ptr()).text();
                return robin_hood::hash_bytes(text.data(), text.size());
            }
            case HeapKind::Function: {
                return robin_hood::hash_int(v.as_raw());
            }
            case HeapKind::List: {
                HeapList it{v.as_ptr()};
                Word h = it.len();
                for (size_t i = 0; i < it.len(); i++) {
                    h = hash_combine(h, hash_value(it.get(i)));
                }
                return h;
            }
            case HeapKind::Struct: {
                // order-independent: keys with colliding hashes may be stored in either order
                HeapStruct it{v.as_ptr()};
                Word h = it.len();
                for (size_t i = 0; i < it.len(); i++) {
                    h += hash_combine(it.hash(i), hash_value(it.value(i)));
                }
                return h;
            }
            case HeapKind::ForeignId: {
                return hash_combine(static_cast<Word>(HeapKind::ForeignId), HeapForeignId(v.as_ptr()).id());
            }
        }
        return 0;
    }

    bool values_equal(OBJECT a, OBJECT b) {
        if (a == b) {
            return true;
        }
        if (!a.is_ptr() || !b.is_ptr()) {
            // distinct inline words, or inline vs. heap: ints and symbols are canonical
            return false;
        }
        HeapObject x{a.as_ptr()};
        HeapObject y{b.as_ptr()};
        if (x.kind() != y.kind()) {
            return false;
        }
        switch (x.kind()) {
            case HeapKind::Int: {
                return mpz_cmp(HeapInt(a.as_ptr()).value(), HeapInt(b.as_ptr()).value()) == 0;
            }
            case HeapKind::Tag: {
                HeapTag s{a.as_ptr()};
                HeapTag t{b.as_ptr()};
                if (s.symbol() != t.symbol()) {
                    return false;
                }
                auto sv = s.value();
                auto tv = t.value();
                if (sv.has_value() != tv.has_value()) {
                    return false;
                }
                return !sv.has_value() || values_equal(*sv, *tv);
            }
            case HeapKind::Text: {
                return HeapText(a.as_ptr()).text() == HeapText(b.as_ptr()).text();
            }
            case HeapKind::Function: {
                // identity only
                return false;
            }
            case HeapKind::List: {
                HeapList s{a.as_ptr()};
                HeapList t{b.as_ptr()};
                if (s.len() != t.len()) {
                    return false;
                }
                for (size_t i = 0; i < s.len(); i++) {
                    if (!values_equal(s.get(i), t.get(i))) {
                        return false;
                    }
                }
                return true;
            }
            case HeapKind::Struct: {
                HeapStruct s{a.as_ptr()};
                HeapStruct t{b.as_ptr()};
                if (s.len() != t.len()) {
                    return false;
                }
                for (size_t i = 0; i < s.len(); i++) {
                    auto other = t.get(s.key(i));
                    if (!other.has_value() || !values_equal(s.value(i), *other)) {
                        return false;
                    }
                }
                return true;
            }
            case HeapKind::ForeignId: {
                return HeapForeignId(a.as_ptr()).id() == HeapForeignId(b.as_ptr()).id();
            }
        }
        return false;
    }

}   // namespace ndl
