#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "ndl-core/assembler.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/int.hh"
#include "ndl-core/printing.hh"
#include "ndl-core/refcount.hh"
#include "ndl-core/vm.hh"

///
/// INTERPRETER TESTS
/// - programs are written as assembly listings
/// - a successful run must leave the stack empty and, once the result is released, the heap too
///

class InterpreterTests: public ::testing::Test {
protected:
    std::shared_ptr<ndl::VCode> code;
    ndl::VirtualMachine* vm = nullptr;
    std::stringstream out;

protected:
    void TearDown() override {
        if (vm != nullptr) {
            ndl::destroy_vm(vm);
        }
    }

    void load(std::string const& listing, ndl::VmOptions options = {}) {
        code = ndl::assemble_string(listing, "test.ndla");
        options.output = &out;
        vm = ndl::create_vm(code, options);
    }

    ndl::Heap& heap() {
        return ndl::vm_heap(vm);
    }

    std::string debug_text(ndl::OBJECT v) {
        return ndl::to_debug_text(v, code->symbols());
    }

    // runs the entry, checks the result, and releases it
    std::string run_to_text(std::optional<ndl::OBJECT> environment = std::nullopt) {
        ndl::RunResult result = ndl::vm_run_main(vm, environment);
        EXPECT_EQ(result.status, ndl::RunStatus::Done);
        if (result.status != ndl::RunStatus::Done) {
            if (result.panic.has_value()) {
                ndl::print_panic(*result.panic, std::cerr);
            }
            return "<failed>";
        }
        EXPECT_EQ(ndl::vm_stack_size(vm), 0u);
        std::string text = debug_text(result.value);
        ndl::release(heap(), result.value);
        EXPECT_EQ(heap().stats().live_object_count, 0u);
        return text;
    }

    ndl::Panic run_to_panic() {
        ndl::RunResult result = ndl::vm_run_main(vm);
        EXPECT_EQ(result.status, ndl::RunStatus::Panicked);
        EXPECT_TRUE(result.panic.has_value());
        EXPECT_TRUE(ndl::vm_is_halted(vm));
        if (!result.panic.has_value()) {
            return ndl::Panic{ndl::PanicKind::Explicit, "<no panic>", "", std::nullopt, {}};
        }
        return *result.panic;
    }
};

TEST_F(InterpreterTests, IntAdd) {
    load(R"(
        .entry main 0
        main:
            create_int 3
            create_int 4
            create_builtin int_add
            call 2
            return
    )");
    EXPECT_EQ(run_to_text(), "7");
}

TEST_F(InterpreterTests, ListLength) {
    load(R"(
        .entry main 0
        main:
            create_int 1
            create_int 2
            create_list 2
            create_builtin list_length
            call 1
            return
    )");
    EXPECT_EQ(run_to_text(), "2");
}

TEST_F(InterpreterTests, StructLookups) {
    load(R"(
        .entry main 0
        main:
            create_symbol Int
            create_int 1
            create_struct 1             ; s
            push_from_stack 0
            duplicate 0
            create_symbol Int
            create_builtin struct_has_key
            call 2                      ; s, True
            push_from_stack 1
            duplicate 0
            create_symbol Text
            create_builtin struct_has_key
            call 2                      ; s, True, False
            push_from_stack 2
            duplicate 0
            create_symbol Int
            create_builtin struct_get
            call 2                      ; s, True, False, 1
            create_list 3               ; s, results
            drop 1
            pop_multiple_below_top 1
            return
    )");
    EXPECT_EQ(run_to_text(), "(True, False, 1)");
}

static char const* const DOUBLE_LISTING = R"(
    .entry main 0
    .scope 0 "double"
    main:
        ARGUMENT
        create_function double 0 1
        call 1
        return
    double:                         ; ret, a
        enter_needs_scope 0 1
        push_from_stack 0
        duplicate 0
        create_builtin type_of
        call 1                      ; ret, a, type
        create_symbol Int
        create_builtin equals
        call 2                      ; ret, a, isInt
        needs "a must be an Int"
        pop
        create_int 2
        create_builtin int_multiply
        call 2                      ; ret, a * 2
        exit_needs_scope
        return
)";

static std::string double_listing(std::string const& argument) {
    std::string listing = DOUBLE_LISTING;
    listing.replace(listing.find("ARGUMENT"), 8, argument);
    return listing;
}

TEST_F(InterpreterTests, NeedsPassesForInts) {
    load(double_listing("create_int 3"));
    EXPECT_EQ(run_to_text(), "6");
}

TEST_F(InterpreterTests, NeedsFailureReportsTheScope) {
    load(double_listing("create_text \"three\""));
    ndl::Panic panic = run_to_panic();
    EXPECT_EQ(panic.kind, ndl::PanicKind::ContractFailure);
    EXPECT_EQ(panic.message, "a must be an Int");
    EXPECT_EQ(panic.failure_value, "False");
    ASSERT_TRUE(panic.scope.has_value());
    EXPECT_EQ(panic.scope->id, 0u);
    EXPECT_EQ(panic.scope->name, std::optional<std::string>{"double"});
    ASSERT_EQ(panic.scope->arguments.size(), 1u);
    EXPECT_EQ(panic.scope->arguments[0], "\"three\"");
}

TEST_F(InterpreterTests, HaltedVmRefusesToRunAgain) {
    load(double_listing("create_text \"three\""));
    run_to_panic();
    EXPECT_THROW(ndl::vm_run_main(vm), ndl::FatalError);
}

TEST_F(InterpreterTests, CallAndReturnBalanceTheStack) {
    load(R"(
        .entry main 0
        main:
            create_int 10
            create_int 20
            create_function add 0 2
            call 2                  ; sum
            create_int 1
            create_function add 0 2
            call 2
            return
        add:                        ; ret, a, b
            create_builtin int_add
            call 2
            return
    )");
    EXPECT_EQ(run_to_text(), "31");
}

TEST_F(InterpreterTests, ClosuresReceiveCapturesBeforeArguments) {
    load(R"(
        .entry main 0
        main:
            create_text "captured"
            create_function pair 1 1    ; the text moves into the closure
            create_int 5
            push_from_stack 1
            duplicate 0
            call 1                      ; f, (captured, 5)
            drop 1
            pop_multiple_below_top 1
            return
        pair:                           ; ret, c, x
            create_list 2
            return
    )");
    EXPECT_EQ(run_to_text(), "(\"captured\", 5)");
}

TEST_F(InterpreterTests, BigIntsPromoteTransparently) {
    load(R"(
        .entry main 0
        main:
            create_int 1152921504606846975
            create_int 1
            create_builtin int_add
            call 2
            create_int 100000000000000000000000000000
            create_builtin int_multiply
            call 2
            return
    )");
    EXPECT_EQ(run_to_text(), "115292150460684697600000000000000000000000000000");
}

TEST_F(InterpreterTests, BigIntLiteralsAreFreshObjects) {
    load(R"(
        .entry main 0
        main:
            create_int -100000000000000000000
            return
    )");
    ndl::RunResult result = ndl::vm_run_main(vm);
    ASSERT_EQ(result.status, ndl::RunStatus::Done);
    ASSERT_TRUE(result.value.is_ptr());
    EXPECT_TRUE(ndl::HeapObject(result.value.as_ptr()).is_reference_counted());
    EXPECT_EQ(ndl::int_to_mpz(result.value), mpz_class{"-100000000000000000000"});
    ndl::release(heap(), result.value);
    EXPECT_EQ(heap().stats().live_object_count, 0u);
}

TEST_F(InterpreterTests, TailCallsRunInConstantStack) {
    ndl::VmOptions options;
    options.max_stack_depth = 64;
    load(R"(
        .entry main 0
        main:
            create_int 10000
            create_function count_down 0 1
            call 1
            return
        count_down:                     ; ret, n
            push_from_stack 0
            create_int 0
            create_builtin equals
            call 2                      ; ret, n, done?
            create_function done 0 0
            push_from_stack 2
            create_function again 1 0   ; ret, n, done?, done, again
            create_builtin if_else
            tail_call 1 3
        again:                          ; ret, n
            create_int 1
            create_builtin int_subtract
            call 2
            create_function count_down 0 1
            tail_call 0 1
        done:                           ; ret
            create_symbol Nothing
            return
    )", options);
    EXPECT_EQ(run_to_text(), "Nothing");
}

TEST_F(InterpreterTests, DeepRecursionExhaustsTheStack) {
    ndl::VmOptions options;
    options.max_stack_depth = 128;
    load(R"(
        .entry main 0
        main:
            create_function forever 0 0
            call 0
            return
        forever:
            create_function forever 0 0
            call 0
            return
    )", options);
    ndl::RunResult result = ndl::vm_run_main(vm);
    EXPECT_EQ(result.status, ndl::RunStatus::ResourceExhausted);
    EXPECT_FALSE(result.exhaustion_message.empty());
    EXPECT_TRUE(ndl::vm_is_halted(vm));
}

TEST_F(InterpreterTests, HeapLimitIsReportedAsExhaustion) {
    ndl::VmOptions options;
    options.max_heap_words = 64;
    load(R"(
        .entry main 0
        main:
            create_int 1000
            create_text "x"
            create_builtin list_filled
            call 2
            return
    )", options);
    ndl::RunResult result = ndl::vm_run_main(vm);
    EXPECT_EQ(result.status, ndl::RunStatus::ResourceExhausted);
}

TEST_F(InterpreterTests, RepeatedSquaringIsReportedAsExhaustion) {
    ndl::VmOptions options;
    options.max_heap_words = 128;
    std::string square =
        "    duplicate 0\n"
        "    push_from_stack 0\n"
        "    create_builtin int_multiply\n"
        "    call 2\n";
    std::string listing =
        ".entry main 0\n"
        "main:\n"
        "    create_int 1\n"
        "    create_int 640\n"
        "    create_builtin int_shift_left\n"
        "    call 2\n";
    for (int i = 0; i < 5; i++) {
        listing += square;
    }
    listing += "    return\n";
    load(listing, options);
    ndl::RunResult result = ndl::vm_run_main(vm);
    EXPECT_EQ(result.status, ndl::RunStatus::ResourceExhausted);
    EXPECT_NE(result.exhaustion_message.find("Heap exhausted"), std::string::npos);
    EXPECT_LE(heap().stats().peak_word_count, 128u);
}

TEST_F(InterpreterTests, CallingASymbolCreatesATag) {
    load(R"(
        .entry main 0
        main:
            create_int 5
            create_symbol Ok
            call 1
            return
    )");
    EXPECT_EQ(run_to_text(), "Ok 5");
}

TEST_F(InterpreterTests, CreateTagMovesTheValue) {
    load(R"(
        .entry main 0
        main:
            create_text "reason"
            create_tag Error
            return
    )");
    EXPECT_EQ(run_to_text(), "Error \"reason\"");
}

TEST_F(InterpreterTests, CallingANonCallablePanics) {
    load(R"(
        .entry main 0
        main:
            create_int 1
            create_int 2
            call 1
            return
    )");
    ndl::Panic panic = run_to_panic();
    EXPECT_EQ(panic.kind, ndl::PanicKind::InvalidCall);
    EXPECT_FALSE(panic.scope.has_value());
}

TEST_F(InterpreterTests, ArityMismatchPanics) {
    load(R"(
        .entry main 0
        main:
            create_function identity 0 1
            call 0
            return
        identity:
            return
    )");
    EXPECT_EQ(run_to_panic().kind, ndl::PanicKind::InvalidCall);
}

TEST_F(InterpreterTests, BuiltinPreconditionPanics) {
    load(R"(
        .entry main 0
        main:
            create_int 1
            create_int 0
            create_builtin int_divide_truncating
            call 2
            return
    )");
    ndl::Panic panic = run_to_panic();
    EXPECT_EQ(panic.kind, ndl::PanicKind::BuiltinPrecondition);
    EXPECT_EQ(panic.failure_value, "builtin<int_divide_truncating>(1, 0)");
}

TEST_F(InterpreterTests, ExplicitPanic) {
    load(R"(
        .entry main 0
        main:
            create_text "boom"
            panic "exploded"
    )");
    ndl::Panic panic = run_to_panic();
    EXPECT_EQ(panic.kind, ndl::PanicKind::Explicit);
    EXPECT_EQ(panic.message, "exploded");
    EXPECT_EQ(panic.failure_value, "\"boom\"");
}

TEST_F(InterpreterTests, ConstantsAreShared) {
    load(R"(
        .entry main 0
        .constant 0 text "shared"
        .constant 1 int 99999999999999999999
        main:
            push_constant 0
            push_constant 1
            create_list 2
            return
    )");
    EXPECT_EQ(run_to_text(), "(\"shared\", 99999999999999999999)");
    EXPECT_FALSE(ndl::HeapObject(code->constant(0).as_ptr()).is_reference_counted());
}

TEST_F(InterpreterTests, PrintUsesTheConfiguredStream) {
    load(R"(
        .entry main 0
        main:
            create_text "hello, world"
            create_builtin print
            call 1
            return
    )");
    EXPECT_EQ(run_to_text(), "Nothing");
    EXPECT_EQ(out.str(), "hello, world\n");
}

TEST_F(InterpreterTests, EntryReceivesTheEnvironment) {
    load(R"(
        .entry main 1
        main:                   ; ret, env
            create_builtin struct_get_keys
            call 1
            return
    )");
    ndl::OBJECT env = ndl::HeapStruct::create(heap(), true, {
        {ndl::OBJECT::make_symbol(ndl::sym::Ok), ndl::OBJECT::make_int(1)}
    }).to_object();
    EXPECT_EQ(run_to_text(env), "(Ok,)");
}

TEST_F(InterpreterTests, HostCallbacksAreCalledThroughHandles) {
    load(R"(
        .entry main 1
        main:                   ; ret, handle
            create_int 5
            push_from_stack 1
            call 1
            pop_multiple_below_top 1
            return
    )");
    ndl::OBJECT handle = ndl::vm_bind_handle(vm, 7, 1, [](ndl::BuiltinContext& ctx, ndl::ArgView const& args) {
        return ndl::BuiltinResult::owned(ndl::int_multiply(ctx.heap, args[0], ndl::OBJECT::make_int(10)));
    });
    EXPECT_EQ(handle.handle_id(), 7u);
    EXPECT_EQ(run_to_text(handle), "50");
}

TEST_F(InterpreterTests, HostCanCallAnyCallable) {
    load(R"(
        .entry main 0
        main:
            create_symbol Nothing
            return
    )");
    ndl::OBJECT arg = ndl::HeapList::create(heap(), true, {ndl::OBJECT::make_int(1)}).to_object();
    ndl::RunResult result = ndl::vm_run(vm, ndl::OBJECT::make_builtin(static_cast<ndl::BuiltinID>(ndl::Builtin::ListLength)), {arg});
    ASSERT_EQ(result.status, ndl::RunStatus::Done);
    EXPECT_EQ(result.value, ndl::OBJECT::make_int(1));
    EXPECT_EQ(ndl::vm_stack_size(vm), 0u);
    EXPECT_EQ(heap().stats().live_object_count, 0u);
    EXPECT_THROW(ndl::vm_run(vm, ndl::OBJECT::make_builtin(0), {arg, arg}), ndl::FatalError);
}
