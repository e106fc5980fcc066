#include "ndl-core/intern.hh"

#include <sstream>

#include "ndl-core/feedback.hh"

namespace ndl {

    SymbolTable::SymbolTable()
    :   m_intern_map(),
        m_string_map()
    {
        m_string_map.reserve(256);
        char const* well_known[sym::WELL_KNOWN_COUNT] = {
            "True", "False", "Nothing",
            "Less", "Equal", "Greater",
            "Int", "Text", "Tag", "List", "Struct", "Function",
            "Ok", "Error", "Builtin"
        };
        for (char const* s: well_known) {
            intern(s);
        }
    }

    SymbolID SymbolTable::intern(std::string const& s) {
        SymbolID new_id = m_string_map.size();
        auto insert_rec = m_intern_map.insert({s, new_id});
        if (insert_rec.second) {
            // new entry => update `m_string_map`
            m_string_map.push_back(s);
            return new_id;
        } else {
            return insert_rec.first->second;
        }
    }

    std::string const& SymbolTable::name(SymbolID id) const {
        if (id >= m_string_map.size()) {
            std::stringstream ss;
            ss << "Unknown symbol ID: " << id << " (table holds " << m_string_map.size() << " symbols)";
            error(ss.str());
            throw FatalError();
        }
        return m_string_map[id];
    }

}   // namespace ndl
