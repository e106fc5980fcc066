#include "ndl-core/vm.hh"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "ndl-core/config.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/int.hh"
#include "ndl-core/printing.hh"
#include "ndl-core/refcount.hh"
#include "ndl-core/vthread.hh"

namespace ndl {

    struct HandleBinding {
        size_t argc;
        HandleCb cb;
    };

    //
    // VirtualMachine (VM)
    //  - owns a heap and one thread of execution over a shared, linked VCode image
    //  - runs a callee to the halt address, a panic, or resource exhaustion
    //  - once stopped by a panic or exhaustion, refuses to run again
    //

    class VirtualMachine {
    private:
        std::shared_ptr<VCode const> m_code;
        VmOptions m_options;
        Heap m_heap;
        VThread m_thread;
        UnstableHashMap<HandleID, HandleBinding> m_handles;
        std::optional<Panic> m_panic;
        bool m_is_halted;

    public:
        VirtualMachine(std::shared_ptr<VCode const> code, VmOptions options);

    // Execution:
    public:
        RunResult run(OBJECT callee, std::vector<OBJECT> const& args);
        RunResult run_main(std::optional<OBJECT> environment);
    private:
        template <bool trace>
        void run_loop();
        void execute(VmExp const& exp);

    // Calls:
    private:
        void call(OBJECT return_address, size_t argc, bool is_tail, size_t locals);
        void call_function(HeapFunction fn, OBJECT return_address, size_t argc, bool is_tail, size_t locals);
        void finish_native_call(BuiltinResult result, OBJECT callee, size_t argc, bool is_tail, size_t locals);
        void do_return();
        ArgView args_view(size_t argc) const;

    // Panics:
    private:
        void raise_panic(PanicKind kind, std::string message, std::string failure_value);
        std::string describe_call(OBJECT callee, size_t argc) const;
        std::vector<std::string> snapshot_arguments(size_t argc) const;

    // Handles:
    public:
        OBJECT bind_handle(HandleID id, size_t argc, HandleCb cb);

    // Properties:
    public:
        Heap& heap() { return m_heap; }
        VThread& thread() { return m_thread; }
        VCode const& code() const { return *m_code; }
        bool is_halted() const { return m_is_halted; }
        void dump(std::ostream& out);
    };

    //
    // ctor
    //

    VirtualMachine::VirtualMachine(std::shared_ptr<VCode const> code, VmOptions options)
    :   m_code(std::move(code)),
        m_options(options),
        m_heap(options.max_heap_words, &m_code->constant_heap()),
        m_thread(options.max_stack_depth),
        m_handles(),
        m_panic(),
        m_is_halted(false)
    {
        if (!m_code->is_linked()) {
            error("Cannot create a VM for an image that has not been linked");
            throw FatalError();
        }
        if (m_options.output == nullptr) {
            m_options.output = &std::cout;
        }
        m_thread.init();
    }

    //
    // Execution:
    //

    RunResult VirtualMachine::run(OBJECT callee, std::vector<OBJECT> const& args) {
        if (m_is_halted) {
            error("Cannot run a VM that was halted by a panic or by resource exhaustion");
            throw FatalError();
        }
        if (args.size() > 1) {
            std::stringstream ss;
            ss << "The entry contract allows at most one argument, got " << args.size();
            error(ss.str());
            throw FatalError();
        }

        VmStack& stack = m_thread.stack();
        size_t const base_size = stack.size();
        m_thread.init();
        m_panic.reset();

        try {
            // the frame of a tail call from the host: the callee returns straight to the halt address.
            stack.push(HALT_RETURN_ADDRESS);
            for (OBJECT arg: args) {
                stack.push(arg);
            }
            stack.push(callee);
            m_thread.regs().is_running = true;
            call(OBJECT::none, args.size(), true, 0);

#if NDL_CONFIG_PRINT_EACH_INSTRUCTION_ON_EXECUTION
            if (m_options.trace_instructions) {
                run_loop<true>();
            } else {
                run_loop<false>();
            }
#else
            run_loop<false>();
#endif
        } catch (ResourceExhaustedError const& e) {
            m_is_halted = true;
            m_thread.regs().is_running = false;
            return RunResult{RunStatus::ResourceExhausted, OBJECT::none, std::nullopt, e.message()};
        }

#if NDL_CONFIG_DUMP_VM_STATE_AFTER_EXECUTION
        dump(std::cout);
#endif

        if (m_panic.has_value()) {
            m_is_halted = true;
            return RunResult{RunStatus::Panicked, OBJECT::none, std::move(m_panic), {}};
        }

        if (stack.size() != base_size + 1) {
            std::stringstream ss;
            ss << "Unbalanced stack after execution: expected " << (base_size + 1)
               << " items, found " << stack.size();
            error(ss.str());
            throw FatalError();
        }
        OBJECT value = stack.pop();
        return RunResult{RunStatus::Done, value, std::nullopt, {}};
    }

    RunResult VirtualMachine::run_main(std::optional<OBJECT> environment) {
        std::optional<VmExpID> entry = m_code->entry_offset();
        if (!entry.has_value()) {
            error("Cannot run the image: it has no `.entry`");
            throw FatalError();
        }
        std::vector<OBJECT> args;
        if (environment.has_value()) {
            args.push_back(*environment);
        }
        OBJECT main_fn = HeapFunction::create(m_heap, true, *entry, m_code->entry_argc(), {}).to_object();
        return run(main_fn, args);
    }

    template <bool trace>
    void VirtualMachine::run_loop() {
        VCode const& code = *m_code;
        VmRegs& regs = m_thread.regs();
        while (regs.is_running) {
            if (regs.ip >= code.size()) {
                std::stringstream ss;
                ss << "Instruction pointer out of range: " << regs.ip << " (image holds " << code.size() << " instructions)";
                error(ss.str());
                throw FatalError();
            }
            VmExp const& exp = code[regs.ip];

            // DEBUG ONLY: print each instruction on execution to help trace
            if (trace) {
                std::cout << "\tVM <- (" << regs.ip << ") ";
                code.print_one_exp(regs.ip, std::cout);
                std::cout << "  [depth=" << m_thread.stack().size() << "]" << std::endl;
            }

            regs.ip++;
            execute(exp);
        }
    }

    void VirtualMachine::execute(VmExp const& exp) {
        VCode const& code = *m_code;
        VmStack& stack = m_thread.stack();
        VmRegs& regs = m_thread.regs();

        switch (exp.kind) {
            case VmExpKind::CreateInt: {
                if (exp.args.i_create_int.inline_raw != 0) {
                    stack.push(OBJECT{exp.args.i_create_int.inline_raw});
                } else {
                    stack.push(make_int(m_heap, code.int_literal(exp.args.i_create_int.literal)));
                }
            } break;
            case VmExpKind::CreateText: {
                std::string const& text = code.text_literal(exp.args.i_create_text.literal);
                stack.push(HeapText::create(m_heap, true, text).to_object());
            } break;
            case VmExpKind::CreateSymbol: {
                stack.push(OBJECT::make_symbol(exp.args.i_create_symbol.symbol));
            } break;
            case VmExpKind::CreateTag: {
                OBJECT value = stack.peek(0);
                OBJECT tag = HeapTag::create(m_heap, true, exp.args.i_create_tag.symbol, value).to_object();
                stack.set(0, tag);
            } break;
            case VmExpKind::CreateList: {
                size_t n = exp.args.i_create_list.n;
                std::vector<OBJECT> items;
                items.reserve(n);
                for (size_t i = 0; i < n; i++) {
                    items.push_back(stack.peek(n - 1 - i));
                }
                OBJECT list = HeapList::create(m_heap, true, items).to_object();
                stack.truncate(stack.size() - n);
                stack.push(list);
            } break;
            case VmExpKind::CreateStruct: {
                size_t n = exp.args.i_create_struct.n;
                std::vector<std::pair<OBJECT, OBJECT>> fields;
                fields.reserve(n);
                for (size_t i = 0; i < n; i++) {
                    size_t key_offset = 2 * (n - i) - 1;
                    fields.emplace_back(stack.peek(key_offset), stack.peek(key_offset - 1));
                }
                OBJECT record = HeapStruct::create(m_heap, true, std::move(fields)).to_object();
                stack.truncate(stack.size() - 2 * n);
                stack.push(record);
            } break;
            case VmExpKind::CreateFunction: {
                size_t k = exp.args.i_create_function.captured_count;
                std::vector<OBJECT> captured;
                captured.reserve(k);
                for (size_t i = 0; i < k; i++) {
                    captured.push_back(stack.peek(k - 1 - i));
                }
                OBJECT fn = HeapFunction::create(
                    m_heap, true,
                    exp.args.i_create_function.body_x,
                    exp.args.i_create_function.argc,
                    captured
                ).to_object();
                stack.truncate(stack.size() - k);
                stack.push(fn);
            } break;
            case VmExpKind::CreateBuiltin: {
                stack.push(OBJECT::make_builtin(exp.args.i_create_builtin.builtin));
            } break;
            case VmExpKind::PushConstant: {
                stack.push(code.constant(exp.args.i_push_constant.constant));
            } break;
            case VmExpKind::Pop: {
                stack.pop();
            } break;
            case VmExpKind::PushFromStack: {
                stack.push(stack.peek(exp.args.i_push_from_stack.offset));
            } break;
            case VmExpKind::PopMultipleBelowTop: {
                stack.remove_below(1, exp.args.i_pop_multiple_below_top.n);
            } break;
            case VmExpKind::Call: {
                call(OBJECT::make_int(static_cast<int64_t>(regs.ip)), exp.args.i_call.argc, false, 0);
            } break;
            case VmExpKind::TailCall: {
                call(OBJECT::none, exp.args.i_tail_call.argc, true, exp.args.i_tail_call.locals);
            } break;
            case VmExpKind::Return: {
                do_return();
            } break;
            case VmExpKind::Duplicate: {
                retain(m_heap, stack.peek(exp.args.i_duplicate.offset), exp.args.i_duplicate.amount);
            } break;
            case VmExpKind::Drop: {
                release(m_heap, stack.peek(exp.args.i_drop.offset));
            } break;
            case VmExpKind::EnterNeedsScope: {
                m_thread.needs().enter(
                    exp.args.i_enter_needs_scope.scope,
                    snapshot_arguments(exp.args.i_enter_needs_scope.argc)
                );
            } break;
            case VmExpKind::ExitNeedsScope: {
                m_thread.needs().exit();
            } break;
            case VmExpKind::Needs: {
                OBJECT condition = stack.peek(0);
                if (!condition.is_symbol(sym::True)) {
                    std::string message = code.text_literal(exp.args.i_needs.reason);
                    if (!condition.is_symbol(sym::False)) {
                        message += " (the condition is not a boolean)";
                    }
                    raise_panic(PanicKind::ContractFailure, std::move(message), to_debug_text(condition, code.symbols()));
                }
            } break;
            case VmExpKind::Panic: {
                OBJECT value = stack.pop();
                std::string failure_value = to_debug_text(value, code.symbols());
                release(m_heap, value);
                raise_panic(PanicKind::Explicit, code.text_literal(exp.args.i_panic.reason), std::move(failure_value));
            } break;
        }
    }

    //
    // Calls:
    // Stack on entry: `a, [ret, local1..localm,] arg1..argn, callee`
    //

    void VirtualMachine::call(OBJECT return_address, size_t argc, bool is_tail, size_t locals) {
        VmStack& stack = m_thread.stack();
        OBJECT callee = stack.peek(0);

        switch (callee.kind()) {
            case InlineKind::Pointer: {
                HeapObject obj = m_heap.checked(callee);
                if (obj.kind() == HeapKind::Function) {
                    call_function(HeapFunction{obj.address()}, return_address, argc, is_tail, locals);
                    return;
                }
            } break;
            case InlineKind::Builtin: {
                BuiltinID id = callee.as_builtin();
                BuiltinTable const& builtins = standard_builtins();
                if (id >= builtins.size()) {
                    std::stringstream ss;
                    ss << "Unknown builtin index " << id << " (ABI v" << BUILTIN_ABI_VERSION << ")";
                    error(ss.str());
                    throw FatalError();
                }
                if (builtins.metadata(id).arity != argc) {
                    std::stringstream ss;
                    ss << "Builtin " << builtins.metadata(id).name << " expects "
                       << builtins.metadata(id).arity << " arguments, got " << argc;
                    raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
                    return;
                }
                BuiltinContext ctx{m_heap, m_code->symbols(), *m_options.output};
                BuiltinResult result = dispatch_builtin(id, ctx, args_view(argc));
                finish_native_call(std::move(result), callee, argc, is_tail, locals);
                return;
            }
            case InlineKind::Symbol: {
                if (argc != 1) {
                    std::stringstream ss;
                    ss << "A symbol can only be called with 1 argument to create a tag, got " << argc;
                    raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
                    return;
                }
                stack.pop();
                OBJECT value = stack.peek(0);
                stack.set(0, HeapTag::create(m_heap, true, callee.as_symbol(), value).to_object());
                if (is_tail) {
                    stack.remove_below(1, locals);
                    do_return();
                }
                return;
            }
            case InlineKind::Handle: {
                auto it = m_handles.find(callee.handle_id());
                if (it == m_handles.end() || it->second.argc != callee.handle_argc()) {
                    std::stringstream ss;
                    ss << "No host callback is bound to handle " << callee.handle_id() << " with " << callee.handle_argc() << " arguments";
                    raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
                    return;
                }
                if (callee.handle_argc() != argc) {
                    std::stringstream ss;
                    ss << "Handle " << callee.handle_id() << " expects " << callee.handle_argc() << " arguments, got " << argc;
                    raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
                    return;
                }
                BuiltinContext ctx{m_heap, m_code->symbols(), *m_options.output};
                BuiltinResult result = it->second.cb(ctx, args_view(argc));
                finish_native_call(std::move(result), callee, argc, is_tail, locals);
                return;
            }
            case InlineKind::Int: {
            } break;
        }

        std::stringstream ss;
        ss << "Cannot call a value of kind " << value_kind_name(value_kind(callee));
        raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
    }

    void VirtualMachine::call_function(HeapFunction fn, OBJECT return_address, size_t argc, bool is_tail, size_t locals) {
        VmStack& stack = m_thread.stack();
        OBJECT callee = fn.to_object();
        if (fn.argc() != argc) {
            std::stringstream ss;
            ss << "Function @" << fn.body() << " expects " << fn.argc() << " arguments, got " << argc;
            raise_panic(PanicKind::InvalidCall, ss.str(), describe_call(callee, argc));
            return;
        }
        if (fn.body() >= m_code->size()) {
            std::stringstream ss;
            ss << "Function body @" << fn.body() << " lies outside the image";
            error(ss.str());
            throw FatalError();
        }
        stack.pop();

        std::vector<OBJECT> frame;
        frame.reserve(1 + fn.captured_count());
        if (is_tail) {
            stack.remove_below(argc, locals);
        } else {
            frame.push_back(return_address);
        }
        for (size_t i = 0; i < fn.captured_count(); i++) {
            OBJECT c = fn.captured(i);
            retain(m_heap, c);
            frame.push_back(c);
        }
        stack.insert_below(argc, frame);

        m_thread.regs().ip = fn.body();
        release(m_heap, callee);
    }

    void VirtualMachine::finish_native_call(BuiltinResult result, OBJECT callee, size_t argc, bool is_tail, size_t locals) {
        VmStack& stack = m_thread.stack();
        switch (result.kind) {
            case BuiltinResult::Kind::Panic: {
                raise_panic(PanicKind::BuiltinPrecondition, std::move(result.reason), describe_call(callee, argc));
                return;
            }
            case BuiltinResult::Kind::Owned: {
            } break;
            case BuiltinResult::Kind::Borrowed:
            case BuiltinResult::Kind::CallFunction: {
                retain(m_heap, result.value);
            } break;
        }

        // the callee is inline, so only the arguments need releasing.
        stack.pop();
        for (size_t i = 0; i < argc; i++) {
            release(m_heap, stack.pop());
        }
        stack.push(result.value);

        if (result.kind == BuiltinResult::Kind::CallFunction) {
            OBJECT return_address = OBJECT::make_int(static_cast<int64_t>(m_thread.regs().ip));
            call(return_address, 0, is_tail, locals);
        } else if (is_tail) {
            stack.remove_below(1, locals);
            do_return();
        }
    }

    void VirtualMachine::do_return() {
        VmStack& stack = m_thread.stack();
        OBJECT value = stack.pop();
        OBJECT ret = stack.pop();
        if (!ret.is_int()) {
            std::stringstream ss;
            ss << "Invalid return address: expected an inline Int, got " << inline_kind_name(ret.kind());
            error(ss.str());
            throw FatalError();
        }
        stack.push(value);
        if (ret == HALT_RETURN_ADDRESS) {
            m_thread.regs().is_running = false;
            return;
        }
        int64_t target = ret.as_int();
        if (target < 0 || static_cast<size_t>(target) >= m_code->size()) {
            std::stringstream ss;
            ss << "Invalid return address: " << target << " lies outside the image";
            error(ss.str());
            throw FatalError();
        }
        m_thread.regs().ip = static_cast<VmExpID>(target);
    }

    ArgView VirtualMachine::args_view(size_t argc) const {
        VmStack const& stack = m_thread.stack();
        if (stack.size() < argc + 1) {
            std::stringstream ss;
            ss << "Stack underflow: a call with " << argc << " arguments on a stack of " << stack.size() << " items";
            error(ss.str());
            throw FatalError();
        }
        return ArgView{stack, stack.size() - 1 - argc, argc};
    }

    //
    // Panics:
    //

    void VirtualMachine::raise_panic(PanicKind kind, std::string message, std::string failure_value) {
        Panic panic{kind, std::move(message), std::move(failure_value), std::nullopt, {}};
        std::vector<NeedsScope> const& scopes = m_thread.needs().scopes();
        for (auto it = scopes.rbegin(); it != scopes.rend(); ++it) {
            panic.scope_chain.push_back(PanicScope{it->id, m_code->scope_name(it->id), it->arguments});
        }
        if (!panic.scope_chain.empty()) {
            panic.scope = panic.scope_chain.front();
        }
        m_panic = std::move(panic);
        m_thread.regs().is_running = false;
    }

    std::string VirtualMachine::describe_call(OBJECT callee, size_t argc) const {
        VmStack const& stack = m_thread.stack();
        std::stringstream ss;
        print_obj(callee, m_code->symbols(), ss);
        ss << '(';
        for (size_t i = 0; i < argc && i + 1 < stack.size(); i++) {
            if (i > 0) {
                ss << ", ";
            }
            print_obj(stack.peek(argc - i), m_code->symbols(), ss);
        }
        ss << ')';
        return ss.str();
    }

    std::vector<std::string> VirtualMachine::snapshot_arguments(size_t argc) const {
        size_t constexpr max_length = NDL_CONFIG_SCOPE_SNAPSHOT_MAX_LENGTH;
        std::vector<std::string> arguments;
        arguments.reserve(argc);
        for (size_t i = 0; i < argc; i++) {
            std::string text = to_debug_text(m_thread.stack().peek(argc - 1 - i), m_code->symbols());
            if (text.size() > max_length) {
                text.resize(max_length - 3);
                text += "...";
            }
            arguments.push_back(std::move(text));
        }
        return arguments;
    }

    //
    // Handles:
    //

    OBJECT VirtualMachine::bind_handle(HandleID id, size_t argc, HandleCb cb) {
        if (argc > OBJECT::HANDLE_ARGC_MAX) {
            std::stringstream ss;
            ss << "Cannot bind handle " << id << ": " << argc << " arguments exceeds the limit of " << OBJECT::HANDLE_ARGC_MAX;
            error(ss.str());
            throw FatalError();
        }
        m_handles[id] = HandleBinding{argc, std::move(cb)};
        return OBJECT::make_handle(id, argc);
    }

    //
    // Dump:
    //

    void VirtualMachine::dump(std::ostream& out) {
        HeapStats const& stats = m_heap.stats();
        out << "<dump>" << std::endl;
        out << "=== STACK (" << m_thread.stack().size() << " items, top last) ===" << std::endl;
        size_t i = 0;
        for (OBJECT v: m_thread.stack()) {
            out << "  [" << i++ << "] ";
            print_obj(v, m_code->symbols(), out);
            out << std::endl;
        }
        out << "=== NEEDS SCOPES ===" << std::endl;
        out << "  depth: " << m_thread.needs().depth() << std::endl;
        out << "=== HEAP ===" << std::endl;
        out << "  live objects: " << stats.live_object_count << std::endl
            << "  live words:   " << stats.live_word_count << std::endl
            << "  peak words:   " << stats.peak_word_count << std::endl
            << "  allocations:  " << stats.allocation_count << std::endl
            << "  frees:        " << stats.deallocation_count << std::endl;
        out << "</dump>" << std::endl;
    }

    //
    // Panic reports:
    //

    std::string panic_kind_name(PanicKind kind) {
        switch (kind) {
            case PanicKind::ContractFailure: return "ContractFailure";
            case PanicKind::BuiltinPrecondition: return "BuiltinPrecondition";
            case PanicKind::InvalidCall: return "InvalidCall";
            case PanicKind::Explicit: return "Explicit";
        }
        return "<unknown>";
    }

    static void print_panic_scope(PanicScope const& scope, char const* prefix, std::ostream& out) {
        out << "  " << prefix << " scope " << scope.id;
        if (scope.name.has_value()) {
            out << " (" << *scope.name << ")";
        }
        out << " with arguments:" << std::endl;
        for (std::string const& arg: scope.arguments) {
            out << "    " << arg << std::endl;
        }
    }

    void print_panic(Panic const& panic, std::ostream& out) {
        out << "panic (" << panic_kind_name(panic.kind) << "): " << panic.message << std::endl;
        out << "  failing value: " << panic.failure_value << std::endl;
        if (!panic.scope_chain.empty()) {
            for (size_t i = 0; i < panic.scope_chain.size(); i++) {
                print_panic_scope(panic.scope_chain[i], (i == 0 ? "in" : "called from"), out);
            }
        } else if (panic.scope.has_value()) {
            print_panic_scope(*panic.scope, "in", out);
        }
    }

    //
    //
    // Interface:
    //
    //

    VirtualMachine* create_vm(std::shared_ptr<VCode const> code, VmOptions options) {
        return new VirtualMachine(std::move(code), options);
    }
    void destroy_vm(VirtualMachine* vm) {
        delete vm;
    }
    Heap& vm_heap(VirtualMachine* vm) {
        return vm->heap();
    }
    OBJECT vm_bind_handle(VirtualMachine* vm, HandleID id, size_t argc, HandleCb cb) {
        return vm->bind_handle(id, argc, std::move(cb));
    }
    RunResult vm_run(VirtualMachine* vm, OBJECT callee, std::vector<OBJECT> const& args) {
        return vm->run(callee, args);
    }
    RunResult vm_run_main(VirtualMachine* vm, std::optional<OBJECT> environment) {
        return vm->run_main(environment);
    }
    size_t vm_stack_size(VirtualMachine* vm) {
        return vm->thread().stack().size();
    }
    bool vm_is_halted(VirtualMachine* vm) {
        return vm->is_halted();
    }
    void dump_vm(VirtualMachine* vm, std::ostream& out) {
        vm->dump(out);
        out << "=== VCODE ===" << std::endl;
        vm->code().dump(out);
    }

}   // namespace ndl
