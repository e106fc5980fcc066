#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <gmpxx.h>

#include "ndl-core/common.hh"
#include "ndl-core/heap.hh"
#include "ndl-core/intern.hh"
#include "ndl-core/needs.hh"
#include "ndl-core/object.hh"
#include "ndl-core/vthread.hh"

///
// Instructions
// Stack effects use `a, x, y -> a, z` with the top on the right.
// All VmExps are stored in a flat table in the 'VCode' and addressed by their index.
//

namespace ndl {

    using LabelID = size_t;
    using LiteralID = size_t;
    using ConstantID = size_t;

    enum class VmExpKind {
        CreateInt,              // a -> a, int
        CreateText,             // a -> a, text
        CreateSymbol,           // a -> a, symbol
        CreateTag,              // a, value -> a, tag
        CreateList,             // a, x1..xn -> a, list
        CreateStruct,           // a, k1, v1, .., kn, vn -> a, struct
        CreateFunction,         // a, c1..cn -> a, function
        CreateBuiltin,          // a -> a, builtin
        PushConstant,           // a -> a, constant
        Pop,                    // a, x -> a
        PushFromStack,          // a, .., x, .. -> a, .., x, .., x
        PopMultipleBelowTop,    // a, x1..xn, top -> a, top
        Call,                   // a, arg1..argn, callee -> a, ret, captured.., arg1..argn (then jump)
        TailCall,               // a, ret, local1..localm, arg1..argn, callee -> a, ret, captured.., arg1..argn
        Return,                 // a, ret, value -> a, value (then jump to ret)
        Duplicate,              // retains a slot
        Drop,                   // releases a slot
        EnterNeedsScope,
        ExitNeedsScope,
        Needs,                  // a, condition -> a, condition (or panic)
        Panic                   // a, value -> panic
    };

    union VmExpArgs {
        struct {} i_none;
        struct { Word inline_raw; LiteralID literal; } i_create_int;     // inline_raw == 0 => heap literal
        struct { LiteralID literal; } i_create_text;
        struct { SymbolID symbol; } i_create_symbol;
        struct { SymbolID symbol; } i_create_tag;
        struct { size_t n; } i_create_list;
        struct { size_t n; } i_create_struct;
        struct { LabelID body; VmExpID body_x; size_t captured_count; size_t argc; } i_create_function;
        struct { BuiltinID builtin; } i_create_builtin;
        struct { ConstantID constant; } i_push_constant;
        struct { size_t offset; } i_push_from_stack;
        struct { size_t n; } i_pop_multiple_below_top;
        struct { size_t argc; } i_call;
        struct { size_t locals; size_t argc; } i_tail_call;
        struct { size_t offset; size_t amount; } i_duplicate;
        struct { size_t offset; } i_drop;
        struct { ScopeID scope; size_t argc; } i_enter_needs_scope;
        struct { LiteralID reason; } i_needs;
        struct { LiteralID reason; } i_panic;
    };

    struct VmExp {
        VmExpKind kind;
        VmExpArgs args;
    public:
        explicit VmExp(VmExpKind new_kind)
        :   kind(new_kind),
            args()
        {}
    };

    std::string const& vmx_mnemonic(VmExpKind kind);
    std::optional<VmExpKind> lookup_vmx_mnemonic(std::string const& mnemonic);

    // the return address that ends interpretation
    inline OBJECT const HALT_RETURN_ADDRESS = OBJECT::make_int(-1);

}   // namespace ndl

///
// VCode = instructions + labels + literals + constants + symbols
// - produced by a lowering pipeline or the assembler, consumed by the VM
// - immutable once linked; many VMs may share one image, including its uncounted constants
//

namespace ndl {

    class VCode {
    // Data members, constructor:
    public:
        inline static constexpr size_t DEFAULT_RESERVED_EXP_COUNT = 1024;
    private:
        std::vector<VmExp> m_exps;
        std::vector<std::optional<VmExpID>> m_label_offsets;
        std::vector<std::string> m_label_names;
        UnstableHashMap<std::string, LabelID> m_label_ids;
        std::vector<mpz_class> m_int_literals;
        std::vector<std::string> m_text_literals;
        std::unique_ptr<Heap> m_constant_heap;
        std::vector<OBJECT> m_constants;
        UnstableHashMap<ScopeID, std::string> m_scope_names;
        SymbolTable m_symbols;
        std::optional<LabelID> m_entry_label;
        size_t m_entry_argc;
        bool m_is_linked;

    public:
        explicit VCode(size_t reserved_exp_count = DEFAULT_RESERVED_EXP_COUNT);
        VCode(VCode const&) = delete;
        VCode& operator=(VCode const&) = delete;

    // Core getters:
    public:
        VmExp const& operator[] (VmExpID exp_id) const { return m_exps[exp_id]; }
        size_t size() const { return m_exps.size(); }
        SymbolTable& symbols() { return m_symbols; }
        SymbolTable const& symbols() const { return m_symbols; }
        mpz_class const& int_literal(LiteralID id) const { return m_int_literals[id]; }
        std::string const& text_literal(LiteralID id) const { return m_text_literals[id]; }
        bool is_linked() const { return m_is_linked; }

    // Labels:
    public:
        LabelID label(std::string const& name);
        void define_label(LabelID label);
        std::optional<VmExpID> label_offset(LabelID label) const { return m_label_offsets[label]; }
        std::string const& label_name(LabelID label) const { return m_label_names[label]; }

    // Literals:
    public:
        LiteralID intern_text_literal(std::string text);

    // creating VM expressions:
    private:
        std::pair<VmExpID, VmExp&> help_new_vmx(VmExpKind kind);
    public:
        VmExpID new_vmx_create_int(mpz_class const& value);
        VmExpID new_vmx_create_text(std::string text);
        VmExpID new_vmx_create_symbol(SymbolID symbol);
        VmExpID new_vmx_create_tag(SymbolID symbol);
        VmExpID new_vmx_create_list(size_t n);
        VmExpID new_vmx_create_struct(size_t n);
        VmExpID new_vmx_create_function(LabelID body, size_t captured_count, size_t argc);
        VmExpID new_vmx_create_builtin(BuiltinID builtin);
        VmExpID new_vmx_push_constant(ConstantID constant);
        VmExpID new_vmx_pop();
        VmExpID new_vmx_push_from_stack(size_t offset);
        VmExpID new_vmx_pop_multiple_below_top(size_t n);
        VmExpID new_vmx_call(size_t argc);
        VmExpID new_vmx_tail_call(size_t locals, size_t argc);
        VmExpID new_vmx_return();
        VmExpID new_vmx_duplicate(size_t offset, size_t amount = 1);
        VmExpID new_vmx_drop(size_t offset);
        VmExpID new_vmx_enter_needs_scope(ScopeID scope, size_t argc);
        VmExpID new_vmx_exit_needs_scope();
        VmExpID new_vmx_needs(std::string reason);
        VmExpID new_vmx_panic(std::string reason);

    // Constants: uncounted objects owned by the image.
    public:
        ConstantID define_constant_int(mpz_class const& value);
        ConstantID define_constant_text(std::string const& text);
        ConstantID define_constant_symbol(SymbolID symbol);
        ConstantID define_constant_foreign_id(Word id);
        OBJECT constant(ConstantID id) const { return m_constants[id]; }
        size_t count_constants() const { return m_constants.size(); }
        Heap const& constant_heap() const { return *m_constant_heap; }

    // Needs scopes, entry point:
    public:
        void define_scope(ScopeID scope, std::string name);
        std::optional<std::string> scope_name(ScopeID scope) const;
        void set_entry(LabelID label, size_t argc);
        std::optional<VmExpID> entry_offset() const;
        size_t entry_argc() const { return m_entry_argc; }

    // linking: resolves labels and validates operands; required before running.
    public:
        void link();

    // dump:
    public:
        void dump(std::ostream& out) const;
        void print_one_exp(VmExpID exp_id, std::ostream& out) const;
    };

}   // namespace ndl
