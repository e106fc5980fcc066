#include "ndl-core/object.hh"

#include <sstream>

#include "ndl-core/feedback.hh"

namespace ndl {

    OBJECT OBJECT::make_ptr(Word* ptr) {
        Word raw = reinterpret_cast<Word>(ptr);
        if (raw == 0 || (raw & KIND_MASK) != 0) {
            std::stringstream ss;
            ss << "Cannot encode heap pointer " << ptr << ": expected a non-null, 8-byte aligned address";
            error(ss.str());
            throw FatalError();
        }
        return OBJECT{raw};
    }

    OBJECT OBJECT::make_int(int64_t val) {
        if (!int_fits_inline(val)) {
            std::stringstream ss;
            ss << "Cannot encode " << val << " as an inline int: out of the 61-bit range";
            error(ss.str());
            throw FatalError();
        }
        return OBJECT{(static_cast<Word>(val) << KIND_BITS) | static_cast<Word>(InlineKind::Int)};
    }

    OBJECT OBJECT::make_builtin(BuiltinID builtin_id) {
        return OBJECT{(static_cast<Word>(builtin_id) << KIND_BITS) | static_cast<Word>(InlineKind::Builtin)};
    }

    OBJECT OBJECT::make_symbol(SymbolID symbol_id) {
        return OBJECT{(static_cast<Word>(symbol_id) << KIND_BITS) | static_cast<Word>(InlineKind::Symbol)};
    }

    OBJECT OBJECT::make_handle(HandleID handle_id, size_t argc) {
        if (argc > HANDLE_ARGC_MAX) {
            std::stringstream ss;
            ss << "Cannot encode handle " << handle_id << " with " << argc << " arguments: too many arguments";
            error(ss.str());
            throw FatalError();
        }
        return OBJECT{
            (static_cast<Word>(handle_id) << HANDLE_ID_SHIFT) |
            (static_cast<Word>(argc) << KIND_BITS) |
            static_cast<Word>(InlineKind::Handle)
        };
    }

    InlineKind OBJECT::kind() const {
        if (m_raw == 0) {
            error("Cannot decode inline value: the zero word is not a value");
            throw FatalError();
        }
        Word tag = m_raw & KIND_MASK;
        switch (tag) {
            case static_cast<Word>(InlineKind::Pointer):
            case static_cast<Word>(InlineKind::Int):
            case static_cast<Word>(InlineKind::Builtin):
            case static_cast<Word>(InlineKind::Symbol):
            case static_cast<Word>(InlineKind::Handle): {
                return static_cast<InlineKind>(tag);
            }
            default: {
                std::stringstream ss;
                ss << "Cannot decode inline value 0x" << std::hex << m_raw << ": unknown kind tag " << std::dec << tag;
                error(ss.str());
                throw FatalError();
            }
        }
    }

    std::string inline_kind_name(InlineKind kind) {
        switch (kind) {
            case InlineKind::Pointer: return "Pointer";
            case InlineKind::Int: return "Int";
            case InlineKind::Builtin: return "Builtin";
            case InlineKind::Symbol: return "Symbol";
            case InlineKind::Handle: return "Handle";
        }
        return "<invalid>";
    }

}   // namespace ndl
