#include "ndl-core/heap.hh"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "ndl-core/config.hh"
#include "ndl-core/equality.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/refcount.hh"

///
// Heap objects:
//

namespace ndl {

    std::string heap_kind_name(HeapKind kind) {
        switch (kind) {
            case HeapKind::Int: return "Int";
            case HeapKind::Tag: return "Tag";
            case HeapKind::Text: return "Text";
            case HeapKind::Function: return "Function";
            case HeapKind::List: return "List";
            case HeapKind::Struct: return "Struct";
            case HeapKind::ForeignId: return "ForeignId";
        }
        return "<invalid>";
    }

    Word HeapObject::make_header(HeapKind kind, bool is_reference_counted, Word fields) {
        if ((fields << FIELDS_SHIFT) >> FIELDS_SHIFT != fields) {
            std::stringstream ss;
            ss << "Cannot pack heap header for " << heap_kind_name(kind) << ": fields 0x" << std::hex << fields << " overflow 60 bits";
            error(ss.str());
            throw FatalError();
        }
        return (
            static_cast<Word>(kind) |
            (is_reference_counted ? IS_REFERENCE_COUNTED_BIT : 0) |
            (fields << FIELDS_SHIFT)
        );
    }

    HeapKind HeapObject::kind() const {
        Word tag = m_ptr[0] & KIND_MASK;
        if (tag > static_cast<Word>(HeapKind::ForeignId)) {
            std::stringstream ss;
            ss << "Corrupt heap object at " << m_ptr << ": header 0x" << std::hex << m_ptr[0] << " has no valid kind";
            error(ss.str());
            throw FatalError();
        }
        return static_cast<HeapKind>(tag);
    }

    size_t HeapObject::content_word_count() const {
        switch (kind()) {
            case HeapKind::Int: return HeapInt::CONTENT_WORD_COUNT;
            case HeapKind::Tag: return 1;
            case HeapKind::Text: return (fields() + sizeof(Word) - 1) / sizeof(Word);
            case HeapKind::Function: return 1 + HeapFunction(m_ptr).captured_count();
            case HeapKind::List: return fields();
            case HeapKind::Struct: return 3 * fields();
            case HeapKind::ForeignId: return 1;
        }
        return 0;
    }

    HeapInt HeapInt::create(Heap& heap, bool is_reference_counted, mpz_class const& value) {
        HeapInt it{heap.allocate(HeapKind::Int, is_reference_counted, 0, CONTENT_WORD_COUNT, mpz_size(value.get_mpz_t())).address()};
        mpz_init_set(reinterpret_cast<mpz_ptr>(it.content()), value.get_mpz_t());
        return it;
    }

    HeapTag HeapTag::create(Heap& heap, bool is_reference_counted, SymbolID symbol, OBJECT value) {
        if (value.is_none()) {
            error("Cannot create a heap tag without a value: use an inline symbol instead");
            throw FatalError();
        }
        HeapTag it{heap.allocate(HeapKind::Tag, is_reference_counted, symbol, 1).address()};
        it.content()[0] = value.as_raw();
        return it;
    }
    std::optional<OBJECT> HeapTag::value() const {
        Word w = content()[0];
        if (w == 0) {
            return {};
        }
        return OBJECT{w};
    }

    HeapText HeapText::create(Heap& heap, bool is_reference_counted, std::string_view text) {
        size_t word_count = (text.size() + sizeof(Word) - 1) / sizeof(Word);
        HeapText it{heap.allocate(HeapKind::Text, is_reference_counted, text.size(), word_count).address()};
        if (word_count > 0) {
            it.content()[word_count - 1] = 0;
            std::memcpy(it.content(), text.data(), text.size());
        }
        return it;
    }

    HeapFunction HeapFunction::create(Heap& heap, bool is_reference_counted, size_t body, size_t argc, std::vector<OBJECT> const& captured) {
        if (argc > ARGC_MASK) {
            std::stringstream ss;
            ss << "Cannot create a function taking " << argc << " arguments: too many arguments";
            error(ss.str());
            throw FatalError();
        }
        Word fields = static_cast<Word>(argc) | (static_cast<Word>(captured.size()) << CAPTURED_SHIFT);
        HeapFunction it{heap.allocate(HeapKind::Function, is_reference_counted, fields, 1 + captured.size()).address()};
        it.content()[0] = body;
        for (size_t i = 0; i < captured.size(); i++) {
            it.content()[1 + i] = captured[i].as_raw();
        }
        return it;
    }

    HeapList HeapList::create(Heap& heap, bool is_reference_counted, std::vector<OBJECT> const& items) {
        HeapList it{heap.allocate(HeapKind::List, is_reference_counted, items.size(), items.size()).address()};
        for (size_t i = 0; i < items.size(); i++) {
            it.content()[i] = items[i].as_raw();
        }
        return it;
    }

    HeapStruct HeapStruct::create(Heap& heap, bool is_reference_counted, std::vector<std::pair<OBJECT, OBJECT>> fields) {
        // de-duplicating: later fields overwrite earlier ones
        std::vector<std::pair<Word, std::pair<OBJECT, OBJECT>>> hashed;
        hashed.reserve(fields.size());
        for (auto& field: fields) {
            Word h = hash_value(field.first);
            auto existing = std::find_if(hashed.begin(), hashed.end(), [&](auto const& it) {
                return it.first == h && values_equal(it.second.first, field.first);
            });
            if (existing != hashed.end()) {
                release(heap, existing->second.first);
                release(heap, existing->second.second);
                existing->second = field;
            } else {
                hashed.push_back({h, field});
            }
        }
        std::stable_sort(hashed.begin(), hashed.end(), [](auto const& a, auto const& b) {
            return a.first < b.first;
        });

        size_t n = hashed.size();
        HeapStruct it{heap.allocate(HeapKind::Struct, is_reference_counted, n, 3 * n).address()};
        for (size_t i = 0; i < n; i++) {
            it.content()[i] = hashed[i].first;
            it.content()[n + i] = hashed[i].second.first.as_raw();
            it.content()[2 * n + i] = hashed[i].second.second.as_raw();
        }
        return it;
    }
    std::optional<size_t> HeapStruct::index_of(OBJECT key) const {
        Word h = hash_value(key);
        for (size_t i = 0; i < len(); i++) {
            if (hash(i) == h && values_equal(this->key(i), key)) {
                return {i};
            }
        }
        return {};
    }
    std::optional<OBJECT> HeapStruct::get(OBJECT key) const {
        auto index = index_of(key);
        if (!index.has_value()) {
            return {};
        }
        return {value(*index)};
    }

    HeapForeignId HeapForeignId::create(Heap& heap, bool is_reference_counted, Word id) {
        HeapForeignId it{heap.allocate(HeapKind::ForeignId, is_reference_counted, 0, 1).address()};
        it.content()[0] = id;
        return it;
    }

    ValueKind value_kind(OBJECT v) {
        switch (v.kind()) {
            case InlineKind::Int: return ValueKind::Int;
            case InlineKind::Builtin: return ValueKind::Builtin;
            case InlineKind::Symbol: return ValueKind::Tag;
            case InlineKind::Handle: return ValueKind::Handle;
            case InlineKind::Pointer: {
                switch (HeapObject(v.as_ptr()).kind()) {
                    case HeapKind::Int: return ValueKind::Int;
                    case HeapKind::Tag: return ValueKind::Tag;
                    case HeapKind::Text: return ValueKind::Text;
                    case HeapKind::Function: return ValueKind::Function;
                    case HeapKind::List: return ValueKind::List;
                    case HeapKind::Struct: return ValueKind::Struct;
                    case HeapKind::ForeignId: return ValueKind::ForeignId;
                }
            } break;
        }
        error("value_kind: unreachable");
        throw FatalError();
    }

    bool is_heap_kind(OBJECT v, HeapKind kind) {
        return v.is_ptr() && HeapObject(v.as_ptr()).kind() == kind;
    }

    std::string value_kind_name(ValueKind kind) {
        switch (kind) {
            case ValueKind::Int: return "Int";
            case ValueKind::Tag: return "Tag";
            case ValueKind::Text: return "Text";
            case ValueKind::Function: return "Function";
            case ValueKind::List: return "List";
            case ValueKind::Struct: return "Struct";
            case ValueKind::ForeignId: return "ForeignId";
            case ValueKind::Builtin: return "Builtin";
            case ValueKind::Handle: return "Handle";
        }
        return "<invalid>";
    }

}   // namespace ndl

///
// Heap:
//

namespace ndl {

    Heap::Heap(size_t max_word_count, Heap const* constant_heap)
    :   m_arenas(),
        m_arena_top(nullptr),
        m_arena_end(nullptr),
        m_free_lists(),
        m_live_objects(),
        m_constant_heap(constant_heap),
        m_max_word_count(max_word_count),
        m_stats()
    {}

    Heap::~Heap() {
        for (auto const& it: m_live_objects) {
            Word* ptr = it.first;
            size_t word_count = it.second;
            if ((ptr[0] & HeapObject::KIND_MASK) == static_cast<Word>(HeapKind::Int)) {
                mpz_clear(reinterpret_cast<mpz_ptr>(HeapObject(ptr).content()));
            }
            if (word_count > MAX_SMALL_OBJECT_WORD_COUNT) {
                delete[] ptr;
            }
        }
    }

    HeapObject Heap::allocate(HeapKind kind, bool is_reference_counted, Word fields, size_t content_word_count, size_t external_word_count) {
        size_t word_count = (is_reference_counted ? 2 : 1) + content_word_count;
        reserve(word_count + external_word_count, "a " + heap_kind_name(kind));

        Word* ptr = allocate_words(word_count);
        ptr[0] = HeapObject::make_header(kind, is_reference_counted, fields);
        if (is_reference_counted) {
            ptr[1] = 1;
        }
        m_live_objects[ptr] = word_count;

        m_stats.live_object_count++;
        m_stats.live_word_count += word_count + external_word_count;
        m_stats.peak_word_count = std::max(m_stats.peak_word_count, m_stats.live_word_count);
        m_stats.allocation_count++;
        return HeapObject{ptr};
    }

    void Heap::deallocate(HeapObject object) {
        Word* ptr = object.address();
        auto it = m_live_objects.find(ptr);
        if (it == m_live_objects.end()) {
            std::stringstream ss;
            ss << "Cannot free " << ptr << ": not a live object of this heap";
            error(ss.str());
            throw FatalError();
        }
        size_t word_count = it->second;
        m_live_objects.erase(it);

        size_t external_word_count = 0;
        if (object.kind() == HeapKind::Int) {
            mpz_ptr value = reinterpret_cast<mpz_ptr>(object.content());
            external_word_count = mpz_size(value);
            mpz_clear(value);
        }
#if NDL_CONFIG_DEBUG_MODE
        // poison: a stale pointer decodes as an invalid kind
        ptr[0] = HeapObject::KIND_MASK;
#endif
        deallocate_words(ptr, word_count);

        m_stats.live_object_count--;
        m_stats.live_word_count -= word_count + external_word_count;
        m_stats.deallocation_count++;
    }

    void Heap::reserve(size_t word_count, std::string const& what) const {
        if (m_max_word_count == 0) {
            return;
        }
        if (word_count > m_max_word_count || m_stats.live_word_count > m_max_word_count - word_count) {
            std::stringstream ss;
            ss << "Heap exhausted: allocating " << word_count << " words for " << what
               << " would exceed the limit of " << m_max_word_count << " words";
            throw ResourceExhaustedError(ss.str());
        }
    }

    Word* Heap::allocate_words(size_t word_count) {
        if (word_count > MAX_SMALL_OBJECT_WORD_COUNT) {
            return new Word[word_count];
        }
        auto& free_list = m_free_lists[word_count];
        if (!free_list.empty()) {
            Word* ptr = free_list.back();
            free_list.pop_back();
            return ptr;
        }
        if (m_arena_top == nullptr || m_arena_top + word_count > m_arena_end) {
            m_arenas.emplace_back(new Word[ARENA_WORD_COUNT]);
            m_arena_top = m_arenas.back().get();
            m_arena_end = m_arena_top + ARENA_WORD_COUNT;
        }
        Word* ptr = m_arena_top;
        m_arena_top += word_count;
        return ptr;
    }

    void Heap::deallocate_words(Word* ptr, size_t word_count) {
        if (word_count > MAX_SMALL_OBJECT_WORD_COUNT) {
            delete[] ptr;
        } else {
            m_free_lists[word_count].push_back(ptr);
        }
    }

    bool Heap::owns(Word const* ptr) const {
        return m_live_objects.find(const_cast<Word*>(ptr)) != m_live_objects.end();
    }

    bool Heap::contains(Word const* ptr) const {
        return owns(ptr) || (m_constant_heap != nullptr && m_constant_heap->contains(ptr));
    }

    HeapObject Heap::checked(OBJECT v) const {
        if (!v.is_ptr()) {
            std::stringstream ss;
            ss << "Expected a heap pointer, got an inline " << inline_kind_name(v.kind());
            error(ss.str());
            throw FatalError();
        }
#if NDL_CONFIG_CHECK_HEAP_ADDRESSES
        if (!contains(v.as_ptr())) {
            std::stringstream ss;
            ss << "Invalid heap address " << v.as_ptr() << ": never allocated or already freed";
            error(ss.str());
            throw FatalError();
        }
#endif
        return HeapObject{v.as_ptr()};
    }

}   // namespace ndl
