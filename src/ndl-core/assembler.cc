#include "ndl-core/assembler.hh"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "ndl-core/builtins.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/utf8.hh"

namespace ndl {

    //
    // Line lexer:
    //

    struct AsmToken {
        std::string text;
        bool is_string;
    };

    class Assembler {
    private:
        std::string m_source_name;
        size_t m_line_index;
        std::shared_ptr<VCode> m_code;

    public:
        explicit Assembler(std::string source_name)
        :   m_source_name(std::move(source_name)),
            m_line_index(0),
            m_code(std::make_shared<VCode>())
        {}

    public:
        std::shared_ptr<VCode> run(std::istream& in);

    private:
        std::vector<AsmToken> lex_line(std::string const& line);
        void assemble_line(std::vector<AsmToken> const& tokens);
        void assemble_directive(std::vector<AsmToken> const& tokens);
        void assemble_instruction(VmExpKind kind, std::vector<AsmToken> const& tokens);

    private:
        [[noreturn]] void fail(std::string const& msg) const;
        void expect_operand_count(std::vector<AsmToken> const& tokens, size_t min_count, size_t max_count) const;
        size_t parse_size(AsmToken const& token) const;
        mpz_class parse_int(AsmToken const& token) const;
        std::string const& parse_word(AsmToken const& token) const;
        std::string const& parse_string(AsmToken const& token) const;
        BuiltinID parse_builtin(AsmToken const& token) const;
    };

    std::shared_ptr<VCode> Assembler::run(std::istream& in) {
        std::string line;
        while (std::getline(in, line)) {
            m_line_index++;
            std::vector<AsmToken> tokens = lex_line(line);
            if (!tokens.empty()) {
                assemble_line(tokens);
            }
        }
        m_code->link();
        return m_code;
    }

    void Assembler::fail(std::string const& msg) const {
        std::stringstream ss;
        ss << m_source_name << ":" << m_line_index << ": " << msg;
        error(ss.str());
        throw FatalError();
    }

    std::vector<AsmToken> Assembler::lex_line(std::string const& line) {
        std::vector<AsmToken> tokens;
        size_t i = 0;
        while (i < line.size()) {
            char c = line[i];
            if (std::isspace(static_cast<unsigned char>(c))) {
                i++;
            }
            else if (c == ';') {
                // comment runs to the end of the line
                break;
            }
            else if (c == '"') {
                std::string text;
                i++;
                bool closed = false;
                while (i < line.size()) {
                    char d = line[i++];
                    if (d == '"') {
                        closed = true;
                        break;
                    }
                    if (d == '\\') {
                        if (i >= line.size()) {
                            fail("unterminated escape sequence in text literal");
                        }
                        char e = line[i++];
                        switch (e) {
                            case 'n': text.push_back('\n'); break;
                            case 't': text.push_back('\t'); break;
                            case '\\': text.push_back('\\'); break;
                            case '"': text.push_back('"'); break;
                            default: fail(std::string("unknown escape sequence '\\") + e + "' in text literal");
                        }
                    } else {
                        text.push_back(d);
                    }
                }
                if (!closed) {
                    fail("unterminated text literal");
                }
                if (!utf8_is_valid(text)) {
                    fail("text literal is not valid UTF-8");
                }
                tokens.push_back({std::move(text), true});
            }
            else {
                size_t start = i;
                while (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i])) && line[i] != ';' && line[i] != '"') {
                    i++;
                }
                tokens.push_back({line.substr(start, i - start), false});
            }
        }
        return tokens;
    }

    void Assembler::assemble_line(std::vector<AsmToken> const& tokens) {
        AsmToken const& head = tokens[0];
        if (head.is_string) {
            fail("expected a label, directive, or mnemonic; got a text literal");
        }
        if (head.text[0] == '.') {
            assemble_directive(tokens);
            return;
        }
        if (head.text.back() == ':') {
            if (tokens.size() != 1) {
                fail("a label must be on a line of its own");
            }
            std::string name = head.text.substr(0, head.text.size() - 1);
            if (name.empty()) {
                fail("empty label name");
            }
            LabelID label = m_code->label(name);
            if (m_code->label_offset(label).has_value()) {
                fail("label '" + name + "' is defined twice");
            }
            m_code->define_label(label);
            return;
        }
        auto kind = lookup_vmx_mnemonic(head.text);
        if (!kind.has_value()) {
            fail("unknown mnemonic '" + head.text + "'");
        }
        assemble_instruction(*kind, tokens);
    }

    void Assembler::assemble_directive(std::vector<AsmToken> const& tokens) {
        std::string const& directive = tokens[0].text;
        if (directive == ".entry") {
            expect_operand_count(tokens, 2, 2);
            m_code->set_entry(m_code->label(parse_word(tokens[1])), parse_size(tokens[2]));
        }
        else if (directive == ".scope") {
            expect_operand_count(tokens, 2, 2);
            m_code->define_scope(parse_size(tokens[1]), parse_string(tokens[2]));
        }
        else if (directive == ".constant") {
            expect_operand_count(tokens, 3, 3);
            size_t index = parse_size(tokens[1]);
            if (index != m_code->count_constants()) {
                std::stringstream ss;
                ss << "constants must be numbered in order: expected " << m_code->count_constants() << ", got " << index;
                fail(ss.str());
            }
            std::string const& kind = parse_word(tokens[2]);
            if (kind == "int") {
                m_code->define_constant_int(parse_int(tokens[3]));
            } else if (kind == "text") {
                m_code->define_constant_text(parse_string(tokens[3]));
            } else if (kind == "symbol") {
                m_code->define_constant_symbol(m_code->symbols().intern(parse_word(tokens[3])));
            } else if (kind == "foreign") {
                m_code->define_constant_foreign_id(parse_size(tokens[3]));
            } else {
                fail("unknown constant kind '" + kind + "': expected int, text, symbol, or foreign");
            }
        }
        else {
            fail("unknown directive '" + directive + "'");
        }
    }

    void Assembler::assemble_instruction(VmExpKind kind, std::vector<AsmToken> const& tokens) {
        VCode& code = *m_code;
        switch (kind) {
            case VmExpKind::CreateInt: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_int(parse_int(tokens[1]));
            } break;
            case VmExpKind::CreateText: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_text(parse_string(tokens[1]));
            } break;
            case VmExpKind::CreateSymbol: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_symbol(code.symbols().intern(parse_word(tokens[1])));
            } break;
            case VmExpKind::CreateTag: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_tag(code.symbols().intern(parse_word(tokens[1])));
            } break;
            case VmExpKind::CreateList: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_list(parse_size(tokens[1]));
            } break;
            case VmExpKind::CreateStruct: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_struct(parse_size(tokens[1]));
            } break;
            case VmExpKind::CreateFunction: {
                expect_operand_count(tokens, 3, 3);
                code.new_vmx_create_function(code.label(parse_word(tokens[1])), parse_size(tokens[2]), parse_size(tokens[3]));
            } break;
            case VmExpKind::CreateBuiltin: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_create_builtin(parse_builtin(tokens[1]));
            } break;
            case VmExpKind::PushConstant: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_push_constant(parse_size(tokens[1]));
            } break;
            case VmExpKind::Pop: {
                expect_operand_count(tokens, 0, 0);
                code.new_vmx_pop();
            } break;
            case VmExpKind::PushFromStack: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_push_from_stack(parse_size(tokens[1]));
            } break;
            case VmExpKind::PopMultipleBelowTop: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_pop_multiple_below_top(parse_size(tokens[1]));
            } break;
            case VmExpKind::Call: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_call(parse_size(tokens[1]));
            } break;
            case VmExpKind::TailCall: {
                expect_operand_count(tokens, 2, 2);
                code.new_vmx_tail_call(parse_size(tokens[1]), parse_size(tokens[2]));
            } break;
            case VmExpKind::Return: {
                expect_operand_count(tokens, 0, 0);
                code.new_vmx_return();
            } break;
            case VmExpKind::Duplicate: {
                expect_operand_count(tokens, 1, 2);
                size_t amount = (tokens.size() == 3 ? parse_size(tokens[2]) : 1);
                code.new_vmx_duplicate(parse_size(tokens[1]), amount);
            } break;
            case VmExpKind::Drop: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_drop(parse_size(tokens[1]));
            } break;
            case VmExpKind::EnterNeedsScope: {
                expect_operand_count(tokens, 2, 2);
                code.new_vmx_enter_needs_scope(parse_size(tokens[1]), parse_size(tokens[2]));
            } break;
            case VmExpKind::ExitNeedsScope: {
                expect_operand_count(tokens, 0, 0);
                code.new_vmx_exit_needs_scope();
            } break;
            case VmExpKind::Needs: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_needs(parse_string(tokens[1]));
            } break;
            case VmExpKind::Panic: {
                expect_operand_count(tokens, 1, 1);
                code.new_vmx_panic(parse_string(tokens[1]));
            } break;
        }
    }

    //
    // Operands:
    //

    void Assembler::expect_operand_count(std::vector<AsmToken> const& tokens, size_t min_count, size_t max_count) const {
        size_t count = tokens.size() - 1;
        if (count < min_count || count > max_count) {
            std::stringstream ss;
            ss << "'" << tokens[0].text << "' expects ";
            if (min_count == max_count) {
                ss << min_count;
            } else {
                ss << min_count << " to " << max_count;
            }
            ss << " operands, got " << count;
            fail(ss.str());
        }
    }

    size_t Assembler::parse_size(AsmToken const& token) const {
        if (token.is_string || token.text.empty()) {
            fail("expected a non-negative integer operand");
        }
        size_t value = 0;
        for (char c: token.text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                fail("expected a non-negative integer operand, got '" + token.text + "'");
            }
            size_t next = value * 10 + static_cast<size_t>(c - '0');
            if (next / 10 != value) {
                fail("integer operand '" + token.text + "' is too large");
            }
            value = next;
        }
        return value;
    }

    mpz_class Assembler::parse_int(AsmToken const& token) const {
        if (token.is_string) {
            fail("expected an integer literal, got a text literal");
        }
        mpz_class value;
        std::string const& text = token.text;
        bool has_digits = text.size() > (text[0] == '-' ? 1 : 0);
        if (!has_digits || value.set_str(text, 10) != 0) {
            fail("invalid integer literal '" + text + "'");
        }
        return value;
    }

    std::string const& Assembler::parse_word(AsmToken const& token) const {
        if (token.is_string) {
            fail("expected a name, got a text literal");
        }
        return token.text;
    }

    std::string const& Assembler::parse_string(AsmToken const& token) const {
        if (!token.is_string) {
            fail("expected a text literal in double quotes, got '" + token.text + "'");
        }
        return token.text;
    }

    BuiltinID Assembler::parse_builtin(AsmToken const& token) const {
        auto builtin = lookup_builtin(parse_word(token));
        if (!builtin.has_value()) {
            fail("unknown builtin '" + token.text + "'");
        }
        return *builtin;
    }

    //
    // Interface:
    //

    std::shared_ptr<VCode> assemble(std::istream& in, std::string const& source_name) {
        Assembler assembler{source_name};
        return assembler.run(in);
    }

    std::shared_ptr<VCode> assemble_string(std::string const& source, std::string const& source_name) {
        std::istringstream in{source};
        return assemble(in, source_name);
    }

    std::shared_ptr<VCode> assemble_file(std::string const& file_path) {
        std::ifstream f;
        f.open(file_path);
        if (!f.is_open()) {
            std::stringstream error_ss;
            error_ss
                << "Failed to load file \"" << file_path << "\" to assemble." << std::endl
                << "Does it exist? Is it readable?";
            error(error_ss.str());
            throw FatalError();
        }
        return assemble(f, file_path);
    }

}   // namespace ndl
