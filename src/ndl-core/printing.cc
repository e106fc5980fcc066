#include "ndl-core/printing.hh"

#include <sstream>

#include "ndl-core/builtins.hh"
#include "ndl-core/heap.hh"

namespace ndl {

    void print_text_literal(std::string_view text, std::ostream& out) {
        out << '"';
        for (char c: text) {
            switch (c) {
                case '"': out << "\\\""; break;
                case '\\': out << "\\\\"; break;
                case '\n': out << "\\n"; break;
                case '\t': out << "\\t"; break;
                default: out << c; break;
            }
        }
        out << '"';
    }

    static void print_symbol(SymbolID id, SymbolTable const& symbols, std::ostream& out) {
        if (symbols.contains(id)) {
            out << symbols.name(id);
        } else {
            out << "<symbol#" << id << ">";
        }
    }

    void print_obj(OBJECT obj, SymbolTable const& symbols, std::ostream& out) {
        switch (obj.kind()) {
            case InlineKind::Int: {
                out << obj.as_int();
            } break;
            case InlineKind::Symbol: {
                print_symbol(obj.as_symbol(), symbols, out);
            } break;
            case InlineKind::Builtin: {
                out << "builtin" << '<';
                if (obj.as_builtin() < BUILTIN_COUNT) {
                    out << builtin_name(obj.as_builtin());
                } else {
                    out << '#' << obj.as_builtin();
                }
                out << '>';
            } break;
            case InlineKind::Handle: {
                out << "handle<" << obj.handle_id() << '/' << obj.handle_argc() << '>';
            } break;
            case InlineKind::Pointer: {
                HeapObject object{obj.as_ptr()};
                switch (object.kind()) {
                    case HeapKind::Int: {
                        out << HeapInt(obj.as_ptr()).to_mpz();
                    } break;
                    case HeapKind::Tag: {
                        HeapTag tag{obj.as_ptr()};
                        print_symbol(tag.symbol(), symbols, out);
                        auto value = tag.value();
                        if (value.has_value()) {
                            bool wrap = is_heap_kind(*value, HeapKind::Tag);
                            out << ' ';
                            if (wrap) { out << '('; }
                            print_obj(*value, symbols, out);
                            if (wrap) { out << ')'; }
                        }
                    } break;
                    case HeapKind::Text: {
                        print_text_literal(HeapText(obj.as_ptr()).text(), out);
                    } break;
                    case HeapKind::Function: {
                        HeapFunction function{obj.as_ptr()};
                        out << "{ fn @" << function.body()
                            << " argc=" << function.argc()
                            << " captured=" << function.captured_count() << " }";
                    } break;
                    case HeapKind::List: {
                        // (,) (a,) (a, b)
                        HeapList list{obj.as_ptr()};
                        out << '(';
                        for (size_t i = 0; i < list.len(); i++) {
                            if (i > 0) {
                                out << ", ";
                            }
                            print_obj(list.get(i), symbols, out);
                        }
                        if (list.len() <= 1) {
                            out << ',';
                        }
                        out << ')';
                    } break;
                    case HeapKind::Struct: {
                        HeapStruct s{obj.as_ptr()};
                        out << '[';
                        for (size_t i = 0; i < s.len(); i++) {
                            if (i > 0) {
                                out << ", ";
                            }
                            print_obj(s.key(i), symbols, out);
                            out << ": ";
                            print_obj(s.value(i), symbols, out);
                        }
                        out << ']';
                    } break;
                    case HeapKind::ForeignId: {
                        out << "foreign<" << HeapForeignId(obj.as_ptr()).id() << '>';
                    } break;
                }
            } break;
        }
    }

    std::string to_debug_text(OBJECT obj, SymbolTable const& symbols) {
        std::stringstream ss;
        print_obj(obj, symbols, ss);
        return ss.str();
    }

}   // namespace ndl
