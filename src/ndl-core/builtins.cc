#include "ndl-core/builtins.hh"

#include <cctype>
#include <sstream>

#include "ndl-core/config.hh"
#include "ndl-core/equality.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/int.hh"
#include "ndl-core/printing.hh"
#include "ndl-core/refcount.hh"
#include "ndl-core/utf8.hh"

///
// Declarations:
//

namespace ndl {

    typedef OBJECT(*IntBinaryOp)(Heap& heap, OBJECT a, OBJECT b);
    typedef OBJECT(*IntShiftOp)(Heap& heap, OBJECT value, size_t amount);

    static void bind_function_builtins(BuiltinTable& t);
    static void bind_int_builtins(BuiltinTable& t);
    static void bind_list_builtins(BuiltinTable& t);
    static void bind_io_builtins(BuiltinTable& t);
    static void bind_struct_builtins(BuiltinTable& t);
    static void bind_tag_builtins(BuiltinTable& t);
    static void bind_text_builtins(BuiltinTable& t);
    static void bind_reflection_builtins(BuiltinTable& t);

    static void bind_int_binary_builtin(BuiltinTable& t, Builtin id, char const* name, IntBinaryOp op, char const* docstring);
    static void bind_int_division_builtin(BuiltinTable& t, Builtin id, char const* name, IntBinaryOp op, char const* docstring);
    static void bind_int_shift_builtin(BuiltinTable& t, Builtin id, char const* name, IntShiftOp op, char const* docstring);

    class BuiltinPreconditionError {
    private:
        std::string m_reason;
    public:
        explicit BuiltinPreconditionError(std::string reason): m_reason(std::move(reason)) {}
        std::string const& reason() const { return m_reason; }
    };

}   // namespace ndl

///
// Table:
//

namespace ndl {

    BuiltinTable::BuiltinTable(size_t init_capacity)
    :   m_cb_table(),
        m_metadata_table(),
        m_id_symtab()
    {
        m_cb_table.reserve(init_capacity);
        m_metadata_table.reserve(init_capacity);
    }

    BuiltinID BuiltinTable::define(
        Builtin expected_id,
        std::string name,
        std::vector<std::string> arg_names,
        BuiltinCb cb,
        std::string docstring
    ) {
        if (m_id_symtab.find(name) != m_id_symtab.end()) {
            error("Cannot re-define builtin: " + name);
            throw FatalError();
        }
        if (m_cb_table.size() != m_metadata_table.size()) {
            error("Corrupt BuiltinTable; expected hot and cold tables to be same length");
            throw FatalError();
        }
        auto new_id = m_cb_table.size();
        if (new_id != static_cast<BuiltinID>(expected_id)) {
            std::stringstream ss;
            ss << "Builtin ABI mismatch: '" << name << "' must have index " << static_cast<BuiltinID>(expected_id)
               << " but would be bound at " << new_id;
            error(ss.str());
            throw FatalError();
        }

        m_cb_table.emplace_back(std::move(cb));
        m_metadata_table.emplace_back(name, std::move(docstring), std::move(arg_names));
        m_id_symtab[name] = new_id;
        return new_id;
    }

    std::optional<BuiltinID> BuiltinTable::lookup(std::string const& name) const {
        auto it = m_id_symtab.find(name);
        if (it != m_id_symtab.end()) {
            return {it->second};
        } else {
            return {};
        }
    }

    BuiltinTable const& standard_builtins() {
        static BuiltinTable const s_table = [] {
            BuiltinTable t;
            bind_function_builtins(t);
            bind_int_builtins(t);
            bind_list_builtins(t);
            bind_io_builtins(t);
            bind_struct_builtins(t);
            bind_tag_builtins(t);
            bind_text_builtins(t);
            bind_reflection_builtins(t);
            if (t.size() != BUILTIN_COUNT) {
                std::stringstream ss;
                ss << "Builtin ABI v" << BUILTIN_ABI_VERSION << " expects " << BUILTIN_COUNT << " builtins, got " << t.size();
                error(ss.str());
                throw FatalError();
            }
            return t;
        }();
        return s_table;
    }

    std::string const& builtin_name(BuiltinID id) {
        return standard_builtins().metadata(id).name;
    }

    std::optional<BuiltinID> lookup_builtin(std::string const& name) {
        return standard_builtins().lookup(name);
    }

    BuiltinResult dispatch_builtin(BuiltinID id, BuiltinContext& ctx, ArgView const& args) {
        BuiltinTable const& t = standard_builtins();
        if (id >= t.size()) {
            std::stringstream ss;
            ss << "Unknown builtin index " << id << " (ABI v" << BUILTIN_ABI_VERSION << " defines " << t.size() << ")";
            error(ss.str());
            throw FatalError();
        }
        BuiltinMetadata const& md = t.metadata(id);
        if (args.size() != md.arity) {
            std::stringstream ss;
            ss << "Builtin " << md.name << " expects " << md.arity << " arguments, but was called with " << args.size();
            return BuiltinResult::panic(ss.str());
        }
        try {
            return t.cb(id)(ctx, args);
        } catch (BuiltinPreconditionError const& e) {
            return BuiltinResult::panic(e.reason());
        }
    }

}   // namespace ndl

///
// Argument checks:
//

namespace ndl {

    [[noreturn]] static void fail(std::string reason) {
        throw BuiltinPreconditionError(std::move(reason));
    }

    [[noreturn]] static void fail_kind(char const* builtin, size_t i, char const* expected, OBJECT got) {
        std::stringstream ss;
        ss << builtin << ": argument " << (i + 1) << " must be " << expected
           << ", got " << value_kind_name(value_kind(got));
        fail(ss.str());
    }

    static OBJECT expect_int(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!is_int(v)) {
            fail_kind(builtin, i, "an Int", v);
        }
        return v;
    }

    // a non-negative Int that fits in a machine word
    static size_t expect_index(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = expect_int(aa, i, builtin);
        auto small = int_to_small(v);
        if (!small.has_value() || *small < 0) {
            std::stringstream ss;
            ss << builtin << ": argument " << (i + 1) << " must be a non-negative index, got " << int_to_mpz(v);
            fail(ss.str());
        }
        return static_cast<size_t>(*small);
    }

    static HeapText expect_text(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!is_heap_kind(v, HeapKind::Text)) {
            fail_kind(builtin, i, "a Text", v);
        }
        return HeapText{v.as_ptr()};
    }

    static HeapList expect_list(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!is_heap_kind(v, HeapKind::List)) {
            fail_kind(builtin, i, "a List", v);
        }
        return HeapList{v.as_ptr()};
    }

    static HeapStruct expect_struct(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!is_heap_kind(v, HeapKind::Struct)) {
            fail_kind(builtin, i, "a Struct", v);
        }
        return HeapStruct{v.as_ptr()};
    }

    static bool expect_bool(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (v.is_symbol(sym::True)) {
            return true;
        }
        if (v.is_symbol(sym::False)) {
            return false;
        }
        fail_kind(builtin, i, "True or False", v);
    }

    static OBJECT expect_tag(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!v.is_symbol() && !is_heap_kind(v, HeapKind::Tag)) {
            fail_kind(builtin, i, "a Tag", v);
        }
        return v;
    }

    static OBJECT expect_callable(ArgView const& aa, size_t i, char const* builtin) {
        OBJECT v = aa[i];
        if (!is_heap_kind(v, HeapKind::Function) && !v.is_builtin() && !v.is_handle()) {
            fail_kind(builtin, i, "a Function", v);
        }
        return v;
    }

    static void check_list_length(Heap& heap, size_t len) {
        if (heap.max_word_count() > 0 && len > heap.max_word_count()) {
            std::stringstream ss;
            ss << "Heap exhausted: a list of " << len << " items exceeds the limit of " << heap.max_word_count() << " words";
            throw ResourceExhaustedError(ss.str());
        }
    }

}   // namespace ndl

///
// Constructors for results: each returns an owned reference.
//

namespace ndl {

    static OBJECT new_text(Heap& heap, std::string_view text) {
        return HeapText::create(heap, true, text).to_object();
    }

    static OBJECT new_list(Heap& heap, std::vector<OBJECT> const& items) {
        return HeapList::create(heap, true, items).to_object();
    }

    static OBJECT new_tag(Heap& heap, SymbolID symbol, OBJECT value) {
        return HeapTag::create(heap, true, symbol, value).to_object();
    }

    // copies `list`'s items, retaining each
    static std::vector<OBJECT> copy_items(Heap& heap, HeapList list) {
        std::vector<OBJECT> items;
        items.reserve(list.len() + 1);
        for (size_t i = 0; i < list.len(); i++) {
            retain(heap, list.get(i));
            items.push_back(list.get(i));
        }
        return items;
    }

}   // namespace ndl

///
// Implementation:
//

namespace ndl {

    void bind_function_builtins(BuiltinTable& t) {
        t.define(Builtin::Equals, "equals", {"a", "b"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(OBJECT::make_bool(values_equal(aa[0], aa[1])));
            },
            "Structural equality. Values of different kinds are never equal."
        );
        t.define(Builtin::FunctionRun, "function_run", {"function"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::call_function(expect_callable(aa, 0, "function_run"));
            },
            "Calls a function without arguments."
        );
        t.define(Builtin::GetArgumentCount, "get_argument_count", {"function"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                OBJECT fn = expect_callable(aa, 0, "get_argument_count");
                size_t argc;
                if (fn.is_builtin()) {
                    argc = standard_builtins().metadata(fn.as_builtin()).arity;
                } else if (fn.is_handle()) {
                    argc = fn.handle_argc();
                } else {
                    argc = HeapFunction(fn.as_ptr()).argc();
                }
                return BuiltinResult::owned(make_int(ctx.heap, static_cast<int64_t>(argc)));
            },
            "Returns the number of arguments a function takes."
        );
        t.define(Builtin::IfElse, "if_else", {"condition", "then", "else"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                bool condition = expect_bool(aa, 0, "if_else");
                OBJECT then_fn = expect_callable(aa, 1, "if_else");
                OBJECT else_fn = expect_callable(aa, 2, "if_else");
                return BuiltinResult::call_function(condition ? then_fn : else_fn);
            },
            "Calls `then` if the condition is True and `else` otherwise."
        );
    }

    void bind_int_binary_builtin(BuiltinTable& t, Builtin id, char const* name, IntBinaryOp op, char const* docstring) {
        t.define(id, name, {"a", "b"},
            [name, op](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                OBJECT a = expect_int(aa, 0, name);
                OBJECT b = expect_int(aa, 1, name);
                return BuiltinResult::owned(op(ctx.heap, a, b));
            },
            docstring
        );
    }

    void bind_int_division_builtin(BuiltinTable& t, Builtin id, char const* name, IntBinaryOp op, char const* docstring) {
        t.define(id, name, {"dividend", "divisor"},
            [name, op](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                OBJECT dividend = expect_int(aa, 0, name);
                OBJECT divisor = expect_int(aa, 1, name);
                if (divisor == OBJECT::make_int(0)) {
                    fail(std::string(name) + ": cannot divide by zero");
                }
                return BuiltinResult::owned(op(ctx.heap, dividend, divisor));
            },
            docstring
        );
    }

    void bind_int_shift_builtin(BuiltinTable& t, Builtin id, char const* name, IntShiftOp op, char const* docstring) {
        t.define(id, name, {"value", "amount"},
            [name, op](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                OBJECT value = expect_int(aa, 0, name);
                size_t amount = expect_index(aa, 1, name);
                return BuiltinResult::owned(op(ctx.heap, value, amount));
            },
            docstring
        );
    }

    static OBJECT int_parse_text(Heap& heap, std::string_view text) {
        std::string_view digits = text;
        if (!digits.empty() && (digits[0] == '-' || digits[0] == '+')) {
            digits.remove_prefix(1);
        }
        char const* problem = nullptr;
        if (text.empty()) {
            problem = "cannot parse integer from empty string";
        } else if (digits.empty()) {
            problem = "invalid digit found in string";
        } else {
            for (char c: digits) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    problem = "invalid digit found in string";
                    break;
                }
            }
        }
        if (problem != nullptr) {
            return new_tag(heap, sym::Error, new_text(heap, problem));
        }

        // mpz_set_str rejects a leading '+'
        std::string normalized{text[0] == '+' ? text.substr(1) : text};
        mpz_class value;
        if (value.set_str(normalized, 10) != 0) {
            return new_tag(heap, sym::Error, new_text(heap, "invalid digit found in string"));
        }
        return new_tag(heap, sym::Ok, make_int(heap, value));
    }

    void bind_int_builtins(BuiltinTable& t) {
        bind_int_binary_builtin(t, Builtin::IntAdd, "int_add", int_add, "Adds two ints.");
        t.define(Builtin::IntBitLength, "int_bit_length", {"value"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(int_bit_length(ctx.heap, expect_int(aa, 0, "int_bit_length")));
            },
            "Number of bits needed to represent the magnitude of an int."
        );
        bind_int_binary_builtin(t, Builtin::IntBitwiseAnd, "int_bitwise_and", int_bitwise_and, "Two's complement bitwise and.");
        bind_int_binary_builtin(t, Builtin::IntBitwiseOr, "int_bitwise_or", int_bitwise_or, "Two's complement bitwise or.");
        bind_int_binary_builtin(t, Builtin::IntBitwiseXor, "int_bitwise_xor", int_bitwise_xor, "Two's complement bitwise xor.");
        t.define(Builtin::IntCompareTo, "int_compare_to", {"a", "b"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                int res = int_compare(expect_int(aa, 0, "int_compare_to"), expect_int(aa, 1, "int_compare_to"));
                SymbolID ordering = (res < 0 ? sym::Less : (res == 0 ? sym::Equal : sym::Greater));
                return BuiltinResult::owned(OBJECT::make_symbol(ordering));
            },
            "Returns Less, Equal or Greater."
        );
        bind_int_division_builtin(t, Builtin::IntDivideTruncating, "int_divide_truncating", int_divide_truncating, "Division rounding towards zero.");
        bind_int_division_builtin(t, Builtin::IntModulo, "int_modulo", int_modulo, "Floored modulo: the result has the sign of the divisor.");
        bind_int_binary_builtin(t, Builtin::IntMultiply, "int_multiply", int_multiply, "Multiplies two ints.");
        t.define(Builtin::IntParse, "int_parse", {"text"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapText text = expect_text(aa, 0, "int_parse");
                return BuiltinResult::owned(int_parse_text(ctx.heap, text.text()));
            },
            "Parses a decimal int: returns `Ok int` or `Error reason`."
        );
        bind_int_division_builtin(t, Builtin::IntRemainder, "int_remainder", int_remainder, "Truncated remainder: the result has the sign of the dividend.");
        bind_int_shift_builtin(t, Builtin::IntShiftLeft, "int_shift_left", int_shift_left, "Shifts left by a non-negative amount.");
        bind_int_shift_builtin(t, Builtin::IntShiftRight, "int_shift_right", int_shift_right, "Arithmetic shift right by a non-negative amount.");
        bind_int_binary_builtin(t, Builtin::IntSubtract, "int_subtract", int_subtract, "Subtracts the second int from the first.");
    }

    void bind_list_builtins(BuiltinTable& t) {
        t.define(Builtin::ListFilled, "list_filled", {"length", "item"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                size_t len = expect_index(aa, 0, "list_filled");
                OBJECT item = aa[1];
                check_list_length(ctx.heap, len);
                if (len > 0) {
                    retain(ctx.heap, item, len);
                }
                return BuiltinResult::owned(new_list(ctx.heap, std::vector<OBJECT>(len, item)));
            },
            "A list holding `length` copies of `item`."
        );
        t.define(Builtin::ListGet, "list_get", {"list", "index"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                HeapList list = expect_list(aa, 0, "list_get");
                size_t index = expect_index(aa, 1, "list_get");
                if (index >= list.len()) {
                    std::stringstream ss;
                    ss << "list_get: index " << index << " is out of bounds for a list of length " << list.len();
                    fail(ss.str());
                }
                return BuiltinResult::borrowed(list.get(index));
            },
            "The item at a zero-based index."
        );
        t.define(Builtin::ListInsert, "list_insert", {"list", "index", "item"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapList list = expect_list(aa, 0, "list_insert");
                size_t index = expect_index(aa, 1, "list_insert");
                if (index > list.len()) {
                    std::stringstream ss;
                    ss << "list_insert: index " << index << " is out of bounds for a list of length " << list.len();
                    fail(ss.str());
                }
                std::vector<OBJECT> items = copy_items(ctx.heap, list);
                retain(ctx.heap, aa[2]);
                items.insert(items.begin() + index, aa[2]);
                return BuiltinResult::owned(new_list(ctx.heap, items));
            },
            "A copy of the list with `item` inserted before `index`."
        );
        t.define(Builtin::ListLength, "list_length", {"list"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapList list = expect_list(aa, 0, "list_length");
                return BuiltinResult::owned(make_int(ctx.heap, static_cast<int64_t>(list.len())));
            },
            "The number of items in a list."
        );
        t.define(Builtin::ListRemoveAt, "list_remove_at", {"list", "index"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapList list = expect_list(aa, 0, "list_remove_at");
                size_t index = expect_index(aa, 1, "list_remove_at");
                if (index >= list.len()) {
                    std::stringstream ss;
                    ss << "list_remove_at: index " << index << " is out of bounds for a list of length " << list.len();
                    fail(ss.str());
                }
                std::vector<OBJECT> items = copy_items(ctx.heap, list);
                OBJECT removed = items[index];
                items.erase(items.begin() + index);
                OBJECT rest = new_list(ctx.heap, items);
                return BuiltinResult::owned(new_list(ctx.heap, {rest, removed}));
            },
            "Returns `(listWithoutItem, item)`."
        );
        t.define(Builtin::ListReplace, "list_replace", {"list", "index", "item"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapList list = expect_list(aa, 0, "list_replace");
                size_t index = expect_index(aa, 1, "list_replace");
                if (index >= list.len()) {
                    std::stringstream ss;
                    ss << "list_replace: index " << index << " is out of bounds for a list of length " << list.len();
                    fail(ss.str());
                }
                std::vector<OBJECT> items = copy_items(ctx.heap, list);
                release(ctx.heap, items[index]);
                retain(ctx.heap, aa[2]);
                items[index] = aa[2];
                return BuiltinResult::owned(new_list(ctx.heap, items));
            },
            "A copy of the list with the item at `index` replaced."
        );
    }

    void bind_io_builtins(BuiltinTable& t) {
        t.define(Builtin::Print, "print", {"message"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapText message = expect_text(aa, 0, "print");
                ctx.out << message.text() << std::endl;
                return BuiltinResult::owned(OBJECT::make_symbol(sym::Nothing));
            },
            "Writes a text and a newline to the VM's output stream."
        );
    }

    void bind_struct_builtins(BuiltinTable& t) {
        t.define(Builtin::StructGet, "struct_get", {"struct", "key"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapStruct s = expect_struct(aa, 0, "struct_get");
                auto value = s.get(aa[1]);
                if (!value.has_value()) {
                    fail("struct_get: the struct does not contain the key " + to_debug_text(aa[1], ctx.symbols));
                }
                return BuiltinResult::borrowed(*value);
            },
            "The value stored under a key."
        );
        t.define(Builtin::StructGetKeys, "struct_get_keys", {"struct"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapStruct s = expect_struct(aa, 0, "struct_get_keys");
                std::vector<OBJECT> keys;
                keys.reserve(s.len());
                for (size_t i = 0; i < s.len(); i++) {
                    retain(ctx.heap, s.key(i));
                    keys.push_back(s.key(i));
                }
                return BuiltinResult::owned(new_list(ctx.heap, keys));
            },
            "A list of the struct's keys."
        );
        t.define(Builtin::StructHasKey, "struct_has_key", {"struct", "key"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                HeapStruct s = expect_struct(aa, 0, "struct_has_key");
                return BuiltinResult::owned(OBJECT::make_bool(s.contains(aa[1])));
            },
            "True iff the struct contains the key."
        );
    }

    void bind_tag_builtins(BuiltinTable& t) {
        t.define(Builtin::TagGetValue, "tag_get_value", {"tag"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                OBJECT tag = expect_tag(aa, 0, "tag_get_value");
                if (tag.is_symbol()) {
                    fail("tag_get_value: the tag has no value");
                }
                return BuiltinResult::borrowed(*HeapTag(tag.as_ptr()).value());
            },
            "The value attached to a tag."
        );
        t.define(Builtin::TagHasValue, "tag_has_value", {"tag"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                OBJECT tag = expect_tag(aa, 0, "tag_has_value");
                return BuiltinResult::owned(OBJECT::make_bool(!tag.is_symbol()));
            },
            "True iff a value is attached to the tag."
        );
        t.define(Builtin::TagWithoutValue, "tag_without_value", {"tag"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                OBJECT tag = expect_tag(aa, 0, "tag_without_value");
                if (tag.is_symbol()) {
                    return BuiltinResult::owned(tag);
                }
                return BuiltinResult::owned(OBJECT::make_symbol(HeapTag(tag.as_ptr()).symbol()));
            },
            "The tag's symbol, without its value."
        );
    }

    void bind_text_builtins(BuiltinTable& t) {
        t.define(Builtin::TextCharacters, "text_characters", {"text"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                std::string_view text = expect_text(aa, 0, "text_characters").text();
                std::vector<size_t> bounds = utf8_boundaries(text);
                check_list_length(ctx.heap, bounds.size() - 1);
                std::vector<OBJECT> characters;
                characters.reserve(bounds.size() - 1);
                for (size_t i = 0; i + 1 < bounds.size(); i++) {
                    characters.push_back(new_text(ctx.heap, text.substr(bounds[i], bounds[i + 1] - bounds[i])));
                }
                return BuiltinResult::owned(new_list(ctx.heap, characters));
            },
            "A list of one-character texts, one per code point."
        );
        t.define(Builtin::TextConcatenate, "text_concatenate", {"a", "b"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                std::string joined{expect_text(aa, 0, "text_concatenate").text()};
                joined += expect_text(aa, 1, "text_concatenate").text();
                return BuiltinResult::owned(new_text(ctx.heap, joined));
            },
            "Concatenates two texts."
        );
        t.define(Builtin::TextContains, "text_contains", {"text", "pattern"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                std::string_view text = expect_text(aa, 0, "text_contains").text();
                std::string_view pattern = expect_text(aa, 1, "text_contains").text();
                return BuiltinResult::owned(OBJECT::make_bool(text.find(pattern) != std::string_view::npos));
            },
            "True iff `pattern` occurs in `text`."
        );
        t.define(Builtin::TextEndsWith, "text_ends_with", {"text", "suffix"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                std::string_view text = expect_text(aa, 0, "text_ends_with").text();
                std::string_view suffix = expect_text(aa, 1, "text_ends_with").text();
                return BuiltinResult::owned(OBJECT::make_bool(text.ends_with(suffix)));
            },
            "True iff `text` ends with `suffix`."
        );
        t.define(Builtin::TextFromUtf8, "text_from_utf8", {"bytes"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                HeapList bytes = expect_list(aa, 0, "text_from_utf8");
                std::string buffer;
                buffer.reserve(bytes.len());
                for (size_t i = 0; i < bytes.len(); i++) {
                    OBJECT b = bytes.get(i);
                    if (!b.is_int() || b.as_int() < 0 || b.as_int() > 255) {
                        fail("text_from_utf8: value is not a byte: " + to_debug_text(b, ctx.symbols));
                    }
                    buffer.push_back(static_cast<char>(b.as_int()));
                }
                if (!utf8_is_valid(buffer)) {
                    return BuiltinResult::owned(new_tag(ctx.heap, sym::Error, new_text(ctx.heap, "invalid UTF-8")));
                }
                return BuiltinResult::owned(new_tag(ctx.heap, sym::Ok, new_text(ctx.heap, buffer)));
            },
            "Decodes a list of bytes: returns `Ok text` or `Error reason`."
        );
        t.define(Builtin::TextGetRange, "text_get_range", {"text", "start_inclusive", "end_exclusive"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                std::string_view text = expect_text(aa, 0, "text_get_range").text();
                size_t start = expect_index(aa, 1, "text_get_range");
                size_t end = expect_index(aa, 2, "text_get_range");
                std::vector<size_t> bounds = utf8_boundaries(text);
                size_t length = bounds.size() - 1;
                if (start > end || end > length) {
                    std::stringstream ss;
                    ss << "text_get_range: range " << start << ".." << end << " is invalid for a text of length " << length;
                    fail(ss.str());
                }
                return BuiltinResult::owned(new_text(ctx.heap, text.substr(bounds[start], bounds[end] - bounds[start])));
            },
            "The code points in [start, end)."
        );
        t.define(Builtin::TextIsEmpty, "text_is_empty", {"text"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(OBJECT::make_bool(expect_text(aa, 0, "text_is_empty").byte_len() == 0));
            },
            "True iff the text is empty."
        );
        t.define(Builtin::TextLength, "text_length", {"text"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                size_t length = utf8_length(expect_text(aa, 0, "text_length").text());
                return BuiltinResult::owned(make_int(ctx.heap, static_cast<int64_t>(length)));
            },
            "The number of code points."
        );
        t.define(Builtin::TextStartsWith, "text_starts_with", {"text", "prefix"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                std::string_view text = expect_text(aa, 0, "text_starts_with").text();
                std::string_view prefix = expect_text(aa, 1, "text_starts_with").text();
                return BuiltinResult::owned(OBJECT::make_bool(text.starts_with(prefix)));
            },
            "True iff `text` starts with `prefix`."
        );
        t.define(Builtin::TextTrimEnd, "text_trim_end", {"text"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(new_text(ctx.heap, utf8_trim_end(expect_text(aa, 0, "text_trim_end").text())));
            },
            "Removes trailing whitespace."
        );
        t.define(Builtin::TextTrimStart, "text_trim_start", {"text"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(new_text(ctx.heap, utf8_trim_start(expect_text(aa, 0, "text_trim_start").text())));
            },
            "Removes leading whitespace."
        );
    }

    void bind_reflection_builtins(BuiltinTable& t) {
        t.define(Builtin::ToDebugText, "to_debug_text", {"value"},
            [](BuiltinContext& ctx, ArgView const& aa) -> BuiltinResult {
                return BuiltinResult::owned(new_text(ctx.heap, to_debug_text(aa[0], ctx.symbols)));
            },
            "Renders any value as text."
        );
        t.define(Builtin::TypeOf, "type_of", {"value"},
            [](BuiltinContext&, ArgView const& aa) -> BuiltinResult {
                SymbolID type;
                switch (value_kind(aa[0])) {
                    case ValueKind::Int: type = sym::Int; break;
                    case ValueKind::Text: type = sym::Text; break;
                    case ValueKind::Tag: type = sym::Tag; break;
                    case ValueKind::List: type = sym::List; break;
                    case ValueKind::Struct: type = sym::Struct; break;
                    case ValueKind::Function: type = sym::Function; break;
                    case ValueKind::Handle: type = sym::Function; break;
                    case ValueKind::Builtin: type = sym::Builtin; break;
                    case ValueKind::ForeignId: {
                        fail("type_of: foreign ids are host values and have no program-visible type");
                    }
                    default: {
                        fail("type_of: unknown value kind");
                    }
                }
                return BuiltinResult::owned(OBJECT::make_symbol(type));
            },
            "The kind of a value as a symbol: Int, Text, Tag, List, Struct, Function or Builtin."
        );
    }

}   // namespace ndl
