#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ndl-core/common.hh"

namespace ndl {

    using SymbolID = size_t;

    // Well-known symbols: every SymbolTable interns these first, so their IDs are fixed.
    // Builtins rely on these IDs; do not reorder.
    namespace sym {
        SymbolID constexpr True     = 0;
        SymbolID constexpr False    = 1;
        SymbolID constexpr Nothing  = 2;
        SymbolID constexpr Less     = 3;
        SymbolID constexpr Equal    = 4;
        SymbolID constexpr Greater  = 5;
        SymbolID constexpr Int      = 6;
        SymbolID constexpr Text     = 7;
        SymbolID constexpr Tag      = 8;
        SymbolID constexpr List     = 9;
        SymbolID constexpr Struct   = 10;
        SymbolID constexpr Function = 11;
        SymbolID constexpr Ok       = 12;
        SymbolID constexpr Error    = 13;
        SymbolID constexpr Builtin  = 14;
        size_t constexpr WELL_KNOWN_COUNT = 15;
    }

    class SymbolTable {
    private:
        UnstableHashMap<std::string, SymbolID> m_intern_map;
        std::vector<std::string> m_string_map;
    public:
        SymbolTable();
    public:
        SymbolID intern(std::string const& s);
        std::string const& name(SymbolID id) const;
        bool contains(SymbolID id) const { return id < m_string_map.size(); }
        size_t size() const { return m_string_map.size(); }
    };

}   // namespace ndl
