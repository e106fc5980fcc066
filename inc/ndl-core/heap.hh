#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gmpxx.h>

#include "ndl-core/common.hh"
#include "ndl-core/object.hh"

///
// Heap objects
// A heap object is a run of words: [header] [refcount]? [content...]
// Header:
//  - bits 2..0:  kind (see `HeapKind`)
//  - bit  3:     set iff the object is reference counted, in which case word 1 is the count
//  - bits 63..4: kind-specific fields
// Objects are immutable after `create` returns.
//

namespace ndl {

    class Heap;

    enum class HeapKind: Word {
        Int         = 0x0,
        Tag         = 0x1,
        Text        = 0x2,
        Function    = 0x3,
        List        = 0x4,
        Struct      = 0x5,
        ForeignId   = 0x6
    };
    std::string heap_kind_name(HeapKind kind);

    class HeapObject {
    public:
        static constexpr Word KIND_MASK = 0x7;
        static constexpr Word IS_REFERENCE_COUNTED_BIT = 0x8;
        static constexpr int FIELDS_SHIFT = 4;

    protected:
        Word* m_ptr;

    public:
        explicit HeapObject(Word* ptr)
        :   m_ptr(ptr)
        {}

    public:
        static Word make_header(HeapKind kind, bool is_reference_counted, Word fields);

    public:
        Word* address() const { return m_ptr; }
        Word header() const { return m_ptr[0]; }
        HeapKind kind() const;
        bool is_reference_counted() const { return (m_ptr[0] & IS_REFERENCE_COUNTED_BIT) != 0; }
        Word fields() const { return m_ptr[0] >> FIELDS_SHIFT; }
        Word refcount() const { return m_ptr[1]; }
        void set_refcount(Word rc) { m_ptr[1] = rc; }
        Word* content() const { return m_ptr + (is_reference_counted() ? 2 : 1); }
        size_t content_word_count() const;
        size_t word_count() const { return (is_reference_counted() ? 2 : 1) + content_word_count(); }
        OBJECT to_object() const { return OBJECT::make_ptr(m_ptr); }
    };

    // HeapInt: only used for values outside the inline range.
    class HeapInt: public HeapObject {
    public:
        static constexpr size_t CONTENT_WORD_COUNT = sizeof(__mpz_struct) / sizeof(Word);
        static_assert(sizeof(__mpz_struct) % sizeof(Word) == 0);
    public:
        explicit HeapInt(Word* ptr): HeapObject(ptr) {}
        static HeapInt create(Heap& heap, bool is_reference_counted, mpz_class const& value);
    public:
        mpz_srcptr value() const { return reinterpret_cast<mpz_srcptr>(content()); }
        mpz_class to_mpz() const { return mpz_class{value()}; }
    };

    // HeapTag: a symbol with an attached value.
    // Symbols without a value are always inline.
    class HeapTag: public HeapObject {
    public:
        explicit HeapTag(Word* ptr): HeapObject(ptr) {}
        static HeapTag create(Heap& heap, bool is_reference_counted, SymbolID symbol, OBJECT value);
    public:
        SymbolID symbol() const { return static_cast<SymbolID>(fields()); }
        std::optional<OBJECT> value() const;
    };

    class HeapText: public HeapObject {
    public:
        explicit HeapText(Word* ptr): HeapObject(ptr) {}
        static HeapText create(Heap& heap, bool is_reference_counted, std::string_view text);
    public:
        size_t byte_len() const { return static_cast<size_t>(fields()); }
        std::string_view text() const { return {reinterpret_cast<char const*>(content()), byte_len()}; }
    };

    // HeapFunction: header fields hold the argument count (bits 31..4) and the capture count (63..32).
    // Content: [body code offset] [captured values...]
    class HeapFunction: public HeapObject {
    public:
        static constexpr Word ARGC_MASK = 0x0FFFFFFF;
        static constexpr int CAPTURED_SHIFT = 28;
    public:
        explicit HeapFunction(Word* ptr): HeapObject(ptr) {}
        static HeapFunction create(Heap& heap, bool is_reference_counted, size_t body, size_t argc, std::vector<OBJECT> const& captured);
    public:
        size_t argc() const { return static_cast<size_t>(fields() & ARGC_MASK); }
        size_t captured_count() const { return static_cast<size_t>(fields() >> CAPTURED_SHIFT); }
        size_t body() const { return static_cast<size_t>(content()[0]); }
        OBJECT captured(size_t i) const { return OBJECT{content()[1 + i]}; }
    };

    class HeapList: public HeapObject {
    public:
        explicit HeapList(Word* ptr): HeapObject(ptr) {}
        // takes ownership of every item
        static HeapList create(Heap& heap, bool is_reference_counted, std::vector<OBJECT> const& items);
    public:
        size_t len() const { return static_cast<size_t>(fields()); }
        OBJECT get(size_t i) const { return OBJECT{content()[i]}; }
    };

    // HeapStruct: content is [hashes...] [keys...] [values...], sorted by hash.
    class HeapStruct: public HeapObject {
    public:
        explicit HeapStruct(Word* ptr): HeapObject(ptr) {}
        // takes ownership of every key and value; on duplicate keys the last field wins and the
        // overwritten key and value are released.
        static HeapStruct create(Heap& heap, bool is_reference_counted, std::vector<std::pair<OBJECT, OBJECT>> fields);
    public:
        size_t len() const { return static_cast<size_t>(fields()); }
        Word hash(size_t i) const { return content()[i]; }
        OBJECT key(size_t i) const { return OBJECT{content()[len() + i]}; }
        OBJECT value(size_t i) const { return OBJECT{content()[2 * len() + i]}; }
        std::optional<size_t> index_of(OBJECT key) const;
        std::optional<OBJECT> get(OBJECT key) const;
        bool contains(OBJECT key) const { return index_of(key).has_value(); }
    };

    // HeapForeignId: an opaque 64-bit ID handed out by the host.
    class HeapForeignId: public HeapObject {
    public:
        explicit HeapForeignId(Word* ptr): HeapObject(ptr) {}
        static HeapForeignId create(Heap& heap, bool is_reference_counted, Word id);
    public:
        Word id() const { return content()[0]; }
    };

    ///
    // ValueKind: the kind a program observes, merging inline and heap representations.
    //

    enum class ValueKind {
        Int,
        Tag,
        Text,
        Function,
        List,
        Struct,
        ForeignId,
        Builtin,
        Handle
    };
    ValueKind value_kind(OBJECT v);
    bool is_heap_kind(OBJECT v, HeapKind kind);
    std::string value_kind_name(ValueKind kind);

    ///
    // Heap: the object store
    // - small objects come from word-granular size classes, carved out of arenas and recycled via free-lists
    // - large objects get their own block
    // - every live object is tracked so that addresses can be validated and so big-int limbs can be
    //   released when the heap is destroyed
    //

    struct HeapStats {
        size_t live_object_count = 0;
        size_t live_word_count = 0;
        size_t peak_word_count = 0;
        size_t allocation_count = 0;
        size_t deallocation_count = 0;
    };

    class Heap {
    public:
        inline static constexpr size_t ARENA_WORD_COUNT = 64 * 1024;
        inline static constexpr size_t MAX_SMALL_OBJECT_WORD_COUNT = 32;

    private:
        std::vector<std::unique_ptr<Word[]>> m_arenas;
        Word* m_arena_top;
        Word* m_arena_end;
        std::array<std::vector<Word*>, MAX_SMALL_OBJECT_WORD_COUNT + 1> m_free_lists;
        UnstableHashMap<Word*, size_t> m_live_objects;
        Heap const* m_constant_heap;
        size_t m_max_word_count;
        HeapStats m_stats;

    public:
        // max_word_count = 0 => unlimited
        explicit Heap(size_t max_word_count = 0, Heap const* constant_heap = nullptr);
        ~Heap();
        Heap(Heap const&) = delete;
        Heap& operator=(Heap const&) = delete;

    public:
        // external_word_count: storage the object owns outside the heap (big-int limbs), charged to the limit.
        HeapObject allocate(HeapKind kind, bool is_reference_counted, Word fields, size_t content_word_count, size_t external_word_count = 0);
        void deallocate(HeapObject object);

        // throws ResourceExhaustedError unless `word_count` more words fit under the limit.
        void reserve(size_t word_count, std::string const& what) const;

    public:
        bool owns(Word const* ptr) const;
        bool contains(Word const* ptr) const;
        HeapObject checked(OBJECT v) const;

    public:
        HeapStats const& stats() const { return m_stats; }
        size_t max_word_count() const { return m_max_word_count; }
        Heap const* constant_heap() const { return m_constant_heap; }

    private:
        Word* allocate_words(size_t word_count);
        void deallocate_words(Word* ptr, size_t word_count);
    };

}   // namespace ndl
