#include <gtest/gtest.h>

#include <sstream>

#include "ndl-core/assembler.hh"
#include "ndl-core/builtins.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/vcode.hh"

///
/// ASSEMBLER TESTS
///

TEST(AssemblerTests, AssemblesAndLinks) {
    auto code = ndl::assemble_string(R"(
        ; a comment line
        .entry main 1
        .scope 4 "main"
        main:
            create_int 7            ; trailing comment
            create_text "a \"quoted\"\n\ttext"
            create_function helper 2 1
            tail_call 1 1
        helper:
            duplicate 1 3
            drop 0
            return
    )");
    ASSERT_TRUE(code->is_linked());
    EXPECT_EQ(code->size(), 7u);
    EXPECT_EQ(code->entry_offset(), std::optional<ndl::VmExpID>{0});
    EXPECT_EQ(code->entry_argc(), 1u);
    EXPECT_EQ(code->scope_name(4), std::optional<std::string>{"main"});

    ndl::VmExp const& text = (*code)[1];
    ASSERT_EQ(text.kind, ndl::VmExpKind::CreateText);
    EXPECT_EQ(code->text_literal(text.args.i_create_text.literal), "a \"quoted\"\n\ttext");

    ndl::VmExp const& fn = (*code)[2];
    ASSERT_EQ(fn.kind, ndl::VmExpKind::CreateFunction);
    EXPECT_EQ(fn.args.i_create_function.body_x, 4u);
    EXPECT_EQ(fn.args.i_create_function.captured_count, 2u);
    EXPECT_EQ(fn.args.i_create_function.argc, 1u);

    ndl::VmExp const& tail = (*code)[3];
    EXPECT_EQ(tail.args.i_tail_call.locals, 1u);
    EXPECT_EQ(tail.args.i_tail_call.argc, 1u);

    ndl::VmExp const& dup = (*code)[4];
    EXPECT_EQ(dup.args.i_duplicate.offset, 1u);
    EXPECT_EQ(dup.args.i_duplicate.amount, 3u);
}

TEST(AssemblerTests, BuiltinsAndSymbolsResolveByName) {
    auto code = ndl::assemble_string(R"(
        .entry main 0
        main:
            create_symbol Color
            create_tag Ok
            create_builtin text_length
            return
    )");
    EXPECT_EQ((*code)[0].args.i_create_symbol.symbol, code->symbols().intern("Color"));
    EXPECT_EQ((*code)[1].args.i_create_tag.symbol, ndl::sym::Ok);
    EXPECT_EQ((*code)[2].args.i_create_builtin.builtin, static_cast<ndl::BuiltinID>(ndl::Builtin::TextLength));
}

TEST(AssemblerTests, Constants) {
    auto code = ndl::assemble_string(R"(
        .constant 0 int 5
        .constant 1 text "hi"
        .constant 2 symbol Greater
        .constant 3 foreign 77
        .entry main 0
        main:
            push_constant 3
            return
    )");
    EXPECT_EQ(code->count_constants(), 4u);
    EXPECT_EQ(code->constant(0), ndl::OBJECT::make_int(5));
    EXPECT_EQ(ndl::HeapText(code->constant(1).as_ptr()).text(), "hi");
    EXPECT_EQ(code->constant(2), ndl::OBJECT::make_symbol(ndl::sym::Greater));
    EXPECT_EQ(ndl::HeapForeignId(code->constant(3).as_ptr()).id(), 77u);
}

TEST(AssemblerTests, TextLiteralsKeepMultiByteCharacters) {
    auto code = ndl::assemble_string(
        ".entry main 0\n"
        "main:\n"
        "    create_text \"h\xC3\xA9llo \xE2\x86\x92\"\n"
        "    return\n"
    );
    ndl::VmExp const& text = (*code)[0];
    EXPECT_EQ(code->text_literal(text.args.i_create_text.literal), "h\xC3\xA9llo \xE2\x86\x92");
}

TEST(AssemblerTests, DumpListsEveryInstruction) {
    auto code = ndl::assemble_string(R"(
        .entry main 0
        main:
            create_int 1
            create_builtin int_add
            return
    )");
    std::stringstream ss;
    code->dump(ss);
    EXPECT_NE(ss.str().find("create_int"), std::string::npos);
    EXPECT_NE(ss.str().find("int_add"), std::string::npos);
    EXPECT_NE(ss.str().find("return"), std::string::npos);
}

TEST(AssemblerTests, ErrorsAreFatal) {
    // unknown mnemonic
    EXPECT_THROW(ndl::assemble_string("jump 3\n"), ndl::FatalError);
    // unknown builtin
    EXPECT_THROW(ndl::assemble_string("create_builtin int_power\n"), ndl::FatalError);
    // wrong operand count
    EXPECT_THROW(ndl::assemble_string("call\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("pop 1\n"), ndl::FatalError);
    // bad operands
    EXPECT_THROW(ndl::assemble_string("call -1\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("create_int 12x\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("create_text unquoted\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("create_text \"unterminated\n"), ndl::FatalError);
    // undefined and duplicate labels
    EXPECT_THROW(ndl::assemble_string("create_function nowhere 0 0\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("a:\na:\nreturn\n"), ndl::FatalError);
    // constants out of order, unknown constants
    EXPECT_THROW(ndl::assemble_string(".constant 1 int 5\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string("push_constant 0\n"), ndl::FatalError);
    // text literals must be valid UTF-8
    EXPECT_THROW(ndl::assemble_string("create_text \"\xE2" "ab\"\n"), ndl::FatalError);
    EXPECT_THROW(ndl::assemble_string(".constant 0 text \"\xFF\"\n"), ndl::FatalError);
    // unknown directive
    EXPECT_THROW(ndl::assemble_string(".section text\n"), ndl::FatalError);
}

TEST(AssemblerTests, MissingFileIsFatal) {
    EXPECT_THROW(ndl::assemble_file("/nonexistent/program.ndla"), ndl::FatalError);
}

TEST(AssemblerTests, MnemonicsRoundTrip) {
    for (size_t i = 0; i <= static_cast<size_t>(ndl::VmExpKind::Panic); i++) {
        auto kind = static_cast<ndl::VmExpKind>(i);
        EXPECT_EQ(ndl::lookup_vmx_mnemonic(ndl::vmx_mnemonic(kind)), std::optional<ndl::VmExpKind>{kind});
    }
}
