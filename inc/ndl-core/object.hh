#pragma once

#include <cstdint>
#include <string>

#include "ndl-core/common.hh"
#include "ndl-core/intern.hh"

///
// OBJECT: an inline value, exactly one word.
// The low 3 bits select the kind:
//  - 000: Pointer to a heap object (8-byte aligned, never 0)
//  - 001: Int, signed 61-bit value in bits 63..3
//  - 010: Builtin, builtin index in bits 63..3
//  - 011: Symbol, symbol ID in bits 63..3
//  - 100: Handle, argument count in bits 31..3, handle ID in bits 63..32
// Every other pattern (and the all-zero word) is a fatal decode error.
// This layout is shared by every image and must not change.
//

namespace ndl {

    enum class InlineKind: Word {
        Pointer = 0x0,
        Int     = 0x1,
        Builtin = 0x2,
        Symbol  = 0x3,
        Handle  = 0x4
    };

    using BuiltinID = size_t;
    using HandleID = uint32_t;

    class OBJECT {
    public:
        static constexpr Word KIND_MASK = 0x7;
        static constexpr int KIND_BITS = 3;
        static constexpr int HANDLE_ID_SHIFT = 32;
        static constexpr Word HANDLE_ARGC_MASK = 0xFFFFFFF8;

        static constexpr int64_t INT_MAX_INLINE = (int64_t{1} << 60) - 1;
        static constexpr int64_t INT_MIN_INLINE = -(int64_t{1} << 60);
        static constexpr size_t HANDLE_ARGC_MAX = (size_t{1} << 29) - 1;

        static OBJECT const none;

    private:
        Word m_raw;

    public:
        constexpr OBJECT(): m_raw(0) {}
        explicit constexpr OBJECT(Word raw): m_raw(raw) {}

    // encoding:
    public:
        static OBJECT make_ptr(Word* ptr);
        static OBJECT make_int(int64_t val);
        static OBJECT make_builtin(BuiltinID builtin_id);
        static OBJECT make_symbol(SymbolID symbol_id);
        static OBJECT make_handle(HandleID handle_id, size_t argc);
        static OBJECT make_bool(bool v) { return make_symbol(v ? sym::True : sym::False); }
        static bool int_fits_inline(int64_t val) { return INT_MIN_INLINE <= val && val <= INT_MAX_INLINE; }

    // decoding:
    public:
        InlineKind kind() const;
        bool is_none() const { return m_raw == 0; }
        bool is_ptr() const { return m_raw != 0 && (m_raw & KIND_MASK) == static_cast<Word>(InlineKind::Pointer); }
        bool is_int() const { return (m_raw & KIND_MASK) == static_cast<Word>(InlineKind::Int); }
        bool is_builtin() const { return (m_raw & KIND_MASK) == static_cast<Word>(InlineKind::Builtin); }
        bool is_symbol() const { return (m_raw & KIND_MASK) == static_cast<Word>(InlineKind::Symbol); }
        bool is_handle() const { return (m_raw & KIND_MASK) == static_cast<Word>(InlineKind::Handle); }
        bool is_symbol(SymbolID id) const { return m_raw == make_symbol(id).m_raw; }

        Word* as_ptr() const { return reinterpret_cast<Word*>(m_raw); }
        int64_t as_int() const { return static_cast<int64_t>(m_raw) >> KIND_BITS; }
        BuiltinID as_builtin() const { return static_cast<BuiltinID>(m_raw >> KIND_BITS); }
        SymbolID as_symbol() const { return static_cast<SymbolID>(m_raw >> KIND_BITS); }
        HandleID handle_id() const { return static_cast<HandleID>(m_raw >> HANDLE_ID_SHIFT); }
        size_t handle_argc() const { return static_cast<size_t>((m_raw & HANDLE_ARGC_MASK) >> KIND_BITS); }

        Word as_raw() const { return m_raw; }

    public:
        bool operator==(OBJECT const& other) const { return m_raw == other.m_raw; }
        bool operator!=(OBJECT const& other) const { return m_raw != other.m_raw; }
    };
    static_assert(sizeof(OBJECT) == sizeof(Word));

    inline constexpr OBJECT OBJECT::none{};

    std::string inline_kind_name(InlineKind kind);

}   // namespace ndl
