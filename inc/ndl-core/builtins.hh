#pragma once

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "ndl-core/common.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/heap.hh"
#include "ndl-core/intern.hh"
#include "ndl-core/object.hh"
#include "ndl-core/vthread.hh"

///
// Builtins
// The index of each builtin is part of the image format: append only, never reorder.
//

namespace ndl {

    size_t constexpr BUILTIN_ABI_VERSION = 1;

    enum class Builtin: BuiltinID {
        Equals,
        FunctionRun,
        GetArgumentCount,
        IfElse,
        IntAdd,
        IntBitLength,
        IntBitwiseAnd,
        IntBitwiseOr,
        IntBitwiseXor,
        IntCompareTo,
        IntDivideTruncating,
        IntModulo,
        IntMultiply,
        IntParse,
        IntRemainder,
        IntShiftLeft,
        IntShiftRight,
        IntSubtract,
        ListFilled,
        ListGet,
        ListInsert,
        ListLength,
        ListRemoveAt,
        ListReplace,
        Print,
        StructGet,
        StructGetKeys,
        StructHasKey,
        TagGetValue,
        TagHasValue,
        TagWithoutValue,
        TextCharacters,
        TextConcatenate,
        TextContains,
        TextEndsWith,
        TextFromUtf8,
        TextGetRange,
        TextIsEmpty,
        TextLength,
        TextStartsWith,
        TextTrimEnd,
        TextTrimStart,
        ToDebugText,
        TypeOf
    };
    size_t constexpr BUILTIN_COUNT = static_cast<size_t>(Builtin::TypeOf) + 1;

    // ArgView: the arguments of a call, still on the stack, in push order.
    class ArgView {
    private:
        VmStack const& m_stack;
        size_t m_base;
        size_t m_count;
    public:
        ArgView(VmStack const& s, size_t base, size_t count)
        :   m_stack(s),
            m_base(base),
            m_count(count) {}
    public:
        size_t size() const { return m_count; }
        OBJECT operator[](size_t idx) const {
            if (idx < m_count) {
                return m_stack.at(m_base + idx);
            } else {
                error("out-of-bounds stack access: cannot reach arg at index " + std::to_string(idx));
                throw FatalError();
            }
        }
    };

    // BuiltinResult: arguments always stay owned by the caller, which releases them after dispatch.
    //  - Owned: a new reference for the caller
    //  - Borrowed: a value reachable from the arguments; the caller retains it before releasing them
    //  - CallFunction: call `value` (borrowed from the arguments) with no arguments, in place of a result
    //  - Panic: a failed precondition
    struct BuiltinResult {
        enum class Kind {
            Owned,
            Borrowed,
            CallFunction,
            Panic
        };
        Kind kind;
        OBJECT value;
        std::string reason;

        static BuiltinResult owned(OBJECT v) { return {Kind::Owned, v, {}}; }
        static BuiltinResult borrowed(OBJECT v) { return {Kind::Borrowed, v, {}}; }
        static BuiltinResult call_function(OBJECT fn) { return {Kind::CallFunction, fn, {}}; }
        static BuiltinResult panic(std::string reason) { return {Kind::Panic, OBJECT::none, std::move(reason)}; }
    };

    struct BuiltinContext {
        Heap& heap;
        SymbolTable const& symbols;
        std::ostream& out;
    };

    using BuiltinCb = std::function<BuiltinResult(BuiltinContext& ctx, ArgView const& args)>;

    struct BuiltinMetadata {
        std::string name;
        size_t arity;
        std::string docstring;
        std::vector<std::string> args;

        BuiltinMetadata(std::string name, std::string docstring, std::vector<std::string> args)
        :   name(std::move(name)), arity(args.size()), docstring(std::move(docstring)), args(std::move(args))
        {}
    };

    class BuiltinTable {
    public:
        inline static size_t const INIT_CAPACITY = 64;

    private:
        std::vector<BuiltinCb> m_cb_table;
        std::vector<BuiltinMetadata> m_metadata_table;
        UnstableHashMap<std::string, BuiltinID> m_id_symtab;

    public:
        explicit BuiltinTable(size_t init_capacity = BuiltinTable::INIT_CAPACITY);

    public:
        BuiltinID define(
            Builtin expected_id,
            std::string name,
            std::vector<std::string> arg_names,
            BuiltinCb cb,
            std::string docstring
        );
    public:
        std::optional<BuiltinID> lookup(std::string const& name) const;
        BuiltinCb const& cb(BuiltinID id) const { return m_cb_table[id]; }
        BuiltinMetadata const& metadata(BuiltinID id) const { return m_metadata_table[id]; }
        size_t size() const { return m_cb_table.size(); }
    };

    BuiltinTable const& standard_builtins();
    std::string const& builtin_name(BuiltinID id);
    std::optional<BuiltinID> lookup_builtin(std::string const& name);

    // checks the index and argument count, runs the builtin, and converts precondition failures into panics.
    BuiltinResult dispatch_builtin(BuiltinID id, BuiltinContext& ctx, ArgView const& args);

}   // namespace ndl
