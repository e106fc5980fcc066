#pragma once

#include <vector>

#include "ndl-core/common.hh"
#include "ndl-core/object.hh"
#include "ndl-core/needs.hh"

namespace ndl {

    using VmExpID = size_t;

    struct VmRegs {
    public:
        VmExpID ip;         // the next instruction
        bool is_running;
    public:
        void init();
    };

    ///
    // VmStack: one stack for operands and return addresses.
    // Offsets count down from the top: offset 0 is the top slot.
    //

    class VmStack {
    private:
        std::vector<OBJECT> m_items;
        size_t m_max_depth;

    public:
        explicit VmStack(size_t max_depth, size_t initial_capacity = 1024);

    public:
        void push(OBJECT x);
        OBJECT pop();
        OBJECT peek(size_t offset) const;
        void set(size_t offset, OBJECT v);

        // `count` slots directly below the top `keep` slots are removed, without releasing them.
        void remove_below(size_t keep, size_t count);
        // `items` are placed directly below the top `keep` slots.
        void insert_below(size_t keep, std::vector<OBJECT> const& items);
        void truncate(size_t new_size);

    public:
        OBJECT at(size_t absolute_index) const { return m_items[absolute_index]; }
        size_t size() const { return m_items.size(); }
        bool empty() const { return m_items.empty(); }
        size_t max_depth() const { return m_max_depth; }
        std::vector<OBJECT>::const_iterator begin() const { return m_items.begin(); }
        std::vector<OBJECT>::const_iterator end() const { return m_items.end(); }

    private:
        void check_offset(size_t offset, char const* what) const;
        void check_depth(size_t new_size) const;
    };

    class VThread {
    private:
        VmRegs m_regs;
        VmStack m_stack;
        NeedsScopeTracker m_needs;
    public:
        explicit VThread(size_t max_stack_depth)
        :   m_regs(),
            m_stack(max_stack_depth),
            m_needs()
        {}
    public:
        void init();
    public:
        inline VmRegs& regs() { return m_regs; }
        inline VmStack& stack() { return m_stack; }
        inline VmStack const& stack() const { return m_stack; }
        inline NeedsScopeTracker& needs() { return m_needs; }
    };

}   // namespace ndl
