#include "ndl-core/vthread.hh"

#include <sstream>

#include "ndl-core/feedback.hh"

namespace ndl {

    void VThread::init() {
        m_regs.init();
        m_needs.clear();
    }

    void VmRegs::init() {
        // ip set by `vm_run`
        ip = 0;
        is_running = false;
    }

    VmStack::VmStack(size_t max_depth, size_t initial_capacity)
    :   m_items(),
        m_max_depth(max_depth)
    {
        m_items.reserve(initial_capacity < max_depth ? initial_capacity : max_depth);
    }

    void VmStack::push(OBJECT x) {
        check_depth(m_items.size() + 1);
        m_items.push_back(x);
    }

    OBJECT VmStack::pop() {
        check_offset(0, "pop");
        OBJECT res = m_items.back();
        m_items.pop_back();
        return res;
    }

    OBJECT VmStack::peek(size_t offset) const {
        check_offset(offset, "peek");
        return m_items[m_items.size() - offset - 1];
    }

    void VmStack::set(size_t offset, OBJECT v) {
        check_offset(offset, "set");
        m_items[m_items.size() - offset - 1] = v;
    }

    void VmStack::remove_below(size_t keep, size_t count) {
        if (count == 0) {
            return;
        }
        check_offset(keep + count - 1, "remove_below");
        auto end = m_items.end() - keep;
        m_items.erase(end - count, end);
    }

    void VmStack::insert_below(size_t keep, std::vector<OBJECT> const& items) {
        if (keep > 0) {
            check_offset(keep - 1, "insert_below");
        }
        check_depth(m_items.size() + items.size());
        m_items.insert(m_items.end() - keep, items.begin(), items.end());
    }

    void VmStack::truncate(size_t new_size) {
        if (new_size < m_items.size()) {
            m_items.resize(new_size);
        }
    }

    void VmStack::check_offset(size_t offset, char const* what) const {
        if (offset >= m_items.size()) {
            std::stringstream ss;
            ss << "Stack underflow in " << what << ": offset " << offset << " but the stack holds " << m_items.size() << " items";
            error(ss.str());
            throw FatalError();
        }
    }

    void VmStack::check_depth(size_t new_size) const {
        if (new_size > m_max_depth) {
            std::stringstream ss;
            ss << "Stack exhausted: depth " << new_size << " exceeds the limit of " << m_max_depth << " slots";
            throw ResourceExhaustedError(ss.str());
        }
    }

}   // namespace ndl
