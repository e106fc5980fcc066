#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "ndl-core/assembler.hh"
#include "ndl-core/config.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/needs.hh"
#include "ndl-core/vm.hh"

///
/// NEEDS SCOPE TESTS
///

TEST(NeedsTests, TrackerIsAStack) {
    ndl::NeedsScopeTracker tracker;
    EXPECT_EQ(tracker.top(), nullptr);
    tracker.enter(1, {"a"});
    tracker.enter(2, {"b", "c"});
    ASSERT_NE(tracker.top(), nullptr);
    EXPECT_EQ(tracker.top()->id, 2u);
    EXPECT_EQ(tracker.top()->arguments.size(), 2u);
    EXPECT_EQ(tracker.depth(), 2u);
    tracker.exit();
    EXPECT_EQ(tracker.top()->id, 1u);
    tracker.exit();
    EXPECT_EQ(tracker.depth(), 0u);
    EXPECT_THROW(tracker.exit(), ndl::FatalError);
}

static ndl::RunResult run_listing(std::string const& listing) {
    std::shared_ptr<ndl::VCode> code = ndl::assemble_string(listing, "needs.ndla");
    std::unique_ptr<ndl::VirtualMachine, void(*)(ndl::VirtualMachine*)> vm{ndl::create_vm(code), ndl::destroy_vm};
    ndl::RunResult result = ndl::vm_run_main(vm.get());
    EXPECT_NE(result.status, ndl::RunStatus::Done);
    return result;
}

TEST(NeedsTests, ScopesDoNotChangeTheSuccessPath) {
    std::shared_ptr<ndl::VCode> code = ndl::assemble_string(R"(
        .entry main 0
        main:
            create_int 1
            enter_needs_scope 3 1
            create_symbol True
            needs "always holds"
            pop
            exit_needs_scope
            return
    )", "needs.ndla");
    ndl::VirtualMachine* vm = ndl::create_vm(code);
    ndl::RunResult result = ndl::vm_run_main(vm);
    EXPECT_EQ(result.status, ndl::RunStatus::Done);
    EXPECT_EQ(result.value, ndl::OBJECT::make_int(1));
    EXPECT_EQ(ndl::vm_stack_size(vm), 0u);
    ndl::destroy_vm(vm);
}

TEST(NeedsTests, NearestScopeIsReported) {
    ndl::RunResult result = run_listing(R"(
        .entry main 0
        .scope 1 "outer"
        main:
            create_int 1
            create_int 2
            enter_needs_scope 1 2
            enter_needs_scope 2 1
            exit_needs_scope
            create_symbol False
            needs "inner scope was exited"
    )");
    ASSERT_TRUE(result.panic.has_value());
    ASSERT_TRUE(result.panic->scope.has_value());
    EXPECT_EQ(result.panic->scope->id, 1u);
    EXPECT_EQ(result.panic->scope->name, std::optional<std::string>{"outer"});
    ASSERT_EQ(result.panic->scope->arguments.size(), 2u);
    EXPECT_EQ(result.panic->scope->arguments[0], "1");
    EXPECT_EQ(result.panic->scope->arguments[1], "2");
    // exited scopes are not part of the chain
    EXPECT_EQ(result.panic->scope_chain.size(), 1u);
}

TEST(NeedsTests, PanicsCarryTheWholeScopeChain) {
    ndl::RunResult result = run_listing(R"(
        .entry main 0
        .scope 0 "main"
        .scope 1 "outer"
        .scope 2 "inner"
        main:
            enter_needs_scope 0 0
            create_int 10
            create_function outer 0 1
            call 1
        outer:                          ; ret, a
            enter_needs_scope 1 1
            push_from_stack 0
            create_function inner 0 1
            call 1
        inner:                          ; ret, b
            enter_needs_scope 2 1
            create_symbol False
            needs "b must be small"
    )");
    ASSERT_TRUE(result.panic.has_value());
    std::vector<ndl::PanicScope> const& chain = result.panic->scope_chain;
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0].id, 2u);
    EXPECT_EQ(chain[0].name, std::optional<std::string>{"inner"});
    EXPECT_EQ(chain[1].id, 1u);
    EXPECT_EQ(chain[1].arguments, std::vector<std::string>{"10"});
    EXPECT_EQ(chain[2].id, 0u);
    EXPECT_TRUE(chain[2].arguments.empty());
    ASSERT_TRUE(result.panic->scope.has_value());
    EXPECT_EQ(result.panic->scope->id, 2u);

    std::stringstream ss;
    ndl::print_panic(*result.panic, ss);
    std::string report = ss.str();
    size_t inner = report.find("in scope 2 (inner)");
    size_t outer = report.find("called from scope 1 (outer)");
    size_t outermost = report.find("called from scope 0 (main)");
    ASSERT_NE(inner, std::string::npos);
    ASSERT_NE(outer, std::string::npos);
    ASSERT_NE(outermost, std::string::npos);
    EXPECT_LT(inner, outer);
    EXPECT_LT(outer, outermost);
}

TEST(NeedsTests, UnnamedScopesHaveNoName) {
    ndl::RunResult result = run_listing(R"(
        .entry main 0
        main:
            enter_needs_scope 9 0
            create_symbol False
            needs "unnamed"
    )");
    ASSERT_TRUE(result.panic.has_value());
    ASSERT_TRUE(result.panic->scope.has_value());
    EXPECT_EQ(result.panic->scope->id, 9u);
    EXPECT_FALSE(result.panic->scope->name.has_value());
}

TEST(NeedsTests, NonBooleanConditionsFail) {
    ndl::RunResult result = run_listing(R"(
        .entry main 0
        main:
            create_int 1
            needs "must be a boolean"
    )");
    ASSERT_TRUE(result.panic.has_value());
    EXPECT_EQ(result.panic->kind, ndl::PanicKind::ContractFailure);
    EXPECT_EQ(result.panic->failure_value, "1");
    EXPECT_NE(result.panic->message.find("not a boolean"), std::string::npos);
    EXPECT_FALSE(result.panic->scope.has_value());
}

TEST(NeedsTests, SnapshotsAreTruncated) {
    std::string long_text(1000, 'x');
    ndl::RunResult result = run_listing(
        ".entry main 0\n"
        "main:\n"
        "    create_text \"" + long_text + "\"\n"
        "    enter_needs_scope 0 1\n"
        "    create_symbol False\n"
        "    needs \"fails\"\n"
    );
    ASSERT_TRUE(result.panic.has_value());
    ASSERT_TRUE(result.panic->scope.has_value());
    std::string const& snapshot = result.panic->scope->arguments.at(0);
    EXPECT_EQ(snapshot.size(), static_cast<size_t>(NDL_CONFIG_SCOPE_SNAPSHOT_MAX_LENGTH));
    EXPECT_EQ(snapshot.substr(snapshot.size() - 3), "...");
    EXPECT_EQ(snapshot.substr(0, 4), "\"xxx");
}

TEST(NeedsTests, UnbalancedExitIsFatal) {
    std::shared_ptr<ndl::VCode> code = ndl::assemble_string(R"(
        .entry main 0
        main:
            exit_needs_scope
            create_symbol Nothing
            return
    )", "needs.ndla");
    ndl::VirtualMachine* vm = ndl::create_vm(code);
    EXPECT_THROW(ndl::vm_run_main(vm), ndl::FatalError);
    ndl::destroy_vm(vm);
}

TEST(NeedsTests, PanicReportIsPrintable) {
    ndl::Panic panic{ndl::PanicKind::ContractFailure, "a must be an Int", "False", ndl::PanicScope{0, "double", {"\"three\""}}, {}};
    std::stringstream ss;
    ndl::print_panic(panic, ss);
    EXPECT_NE(ss.str().find("ContractFailure"), std::string::npos);
    EXPECT_NE(ss.str().find("(double)"), std::string::npos);
    EXPECT_NE(ss.str().find("\"three\""), std::string::npos);
}
