#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "ndl-core/intern.hh"
#include "ndl-core/object.hh"

namespace ndl {

    void print_obj(OBJECT obj, SymbolTable const& symbols, std::ostream& out);
    std::string to_debug_text(OBJECT obj, SymbolTable const& symbols);

    // writes `text` as a double-quoted literal with escapes
    void print_text_literal(std::string_view text, std::ostream& out);

}   // namespace ndl
