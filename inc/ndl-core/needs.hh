#pragma once

#include <string>
#include <vector>

#include "ndl-core/common.hh"

///
// Needs scopes
// `EnterNeedsScope` and `ExitNeedsScope` bracket a logical invocation so that a failed `Needs`
// can name the enclosing function and its arguments. Purely diagnostic: never touches counts
// or the stack shape.
//

namespace ndl {

    using ScopeID = size_t;

    struct NeedsScope {
        ScopeID id;
        std::vector<std::string> arguments;
    };

    class NeedsScopeTracker {
    private:
        std::vector<NeedsScope> m_scopes;
    public:
        NeedsScopeTracker() = default;
    public:
        void enter(ScopeID id, std::vector<std::string> arguments);
        void exit();
        NeedsScope const* top() const;
        size_t depth() const { return m_scopes.size(); }
        // outermost first
        std::vector<NeedsScope> const& scopes() const { return m_scopes; }
        void clear() { m_scopes.clear(); }
    };

}   // namespace ndl
