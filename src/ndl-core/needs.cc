#include "ndl-core/needs.hh"

#include "ndl-core/feedback.hh"

namespace ndl {

    void NeedsScopeTracker::enter(ScopeID id, std::vector<std::string> arguments) {
        m_scopes.push_back({id, std::move(arguments)});
    }

    void NeedsScopeTracker::exit() {
        if (m_scopes.empty()) {
            error("Unbalanced needs scopes: `exit_needs_scope` without a matching `enter_needs_scope`");
            throw FatalError();
        }
        m_scopes.pop_back();
    }

    NeedsScope const* NeedsScopeTracker::top() const {
        if (m_scopes.empty()) {
            return nullptr;
        }
        return &m_scopes.back();
    }

}   // namespace ndl
