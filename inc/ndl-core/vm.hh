#pragma once

#include <iostream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "ndl-core/builtins.hh"
#include "ndl-core/heap.hh"
#include "ndl-core/needs.hh"
#include "ndl-core/object.hh"
#include "ndl-core/vcode.hh"

namespace ndl {

    //
    // Type declarations/early definitions:
    //

    class VirtualMachine;

    struct VmOptions {
        size_t max_stack_depth = 1024 * 1024;
        size_t max_heap_words = 256 * 1024 * 1024;     // 0 => unlimited
        bool trace_instructions = false;
        std::ostream* output = &std::cout;
    };

    enum class PanicKind {
        ContractFailure,
        BuiltinPrecondition,
        InvalidCall,
        Explicit
    };
    std::string panic_kind_name(PanicKind kind);

    struct PanicScope {
        ScopeID id;
        std::optional<std::string> name;
        std::vector<std::string> arguments;
    };

    // Panic: the failure report. Holds no heap references, so it outlives the VM that raised it.
    // `scope` is the innermost open needs scope; `scope_chain` holds every open scope, innermost first.
    struct Panic {
        PanicKind kind;
        std::string message;
        std::string failure_value;
        std::optional<PanicScope> scope;
        std::vector<PanicScope> scope_chain;
    };
    void print_panic(Panic const& panic, std::ostream& out);

    enum class RunStatus {
        Done,
        Panicked,
        ResourceExhausted
    };

    // RunResult: when `status == Done`, `value` is owned by the host.
    struct RunResult {
        RunStatus status;
        OBJECT value;
        std::optional<Panic> panic;
        std::string exhaustion_message;
    };

    using HandleCb = BuiltinCb;

    //
    // Virtual machine:
    //

    // create_vm instantiates a VM running `code`, which must be linked.
    VirtualMachine* create_vm(std::shared_ptr<VCode const> code, VmOptions options = {});

    // destroy_vm destroys a VM, freeing every object still in its heap.
    void destroy_vm(VirtualMachine* vm);

    // the heap that host-created arguments must live in, and that results must be released into.
    Heap& vm_heap(VirtualMachine* vm);

    // binds a host callback and returns the handle value a program can call.
    OBJECT vm_bind_handle(VirtualMachine* vm, HandleID id, size_t argc, HandleCb cb);

    // vm_run calls `callee` with at most one argument, taking ownership of both.
    RunResult vm_run(VirtualMachine* vm, OBJECT callee, std::vector<OBJECT> const& args);

    // vm_run_main calls the image's entry label, passing `environment` if present.
    RunResult vm_run_main(VirtualMachine* vm, std::optional<OBJECT> environment = std::nullopt);

    size_t vm_stack_size(VirtualMachine* vm);
    bool vm_is_halted(VirtualMachine* vm);

    // dump_vm prints the VM's state for debug information.
    void dump_vm(VirtualMachine* vm, std::ostream& out);

}   // namespace ndl
