#include "ndl-core/vcode.hh"

#include <map>
#include <sstream>

#include "ndl-core/builtins.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/printing.hh"

namespace ndl {

    static std::vector<std::string> const s_mnemonics = {
        "create_int",
        "create_text",
        "create_symbol",
        "create_tag",
        "create_list",
        "create_struct",
        "create_function",
        "create_builtin",
        "push_constant",
        "pop",
        "push_from_stack",
        "pop_multiple_below_top",
        "call",
        "tail_call",
        "return",
        "duplicate",
        "drop",
        "enter_needs_scope",
        "exit_needs_scope",
        "needs",
        "panic"
    };

    std::string const& vmx_mnemonic(VmExpKind kind) {
        return s_mnemonics[static_cast<size_t>(kind)];
    }

    std::optional<VmExpKind> lookup_vmx_mnemonic(std::string const& mnemonic) {
        for (size_t i = 0; i < s_mnemonics.size(); i++) {
            if (s_mnemonics[i] == mnemonic) {
                return {static_cast<VmExpKind>(i)};
            }
        }
        return {};
    }

    VCode::VCode(size_t reserved_exp_count)
    :   m_exps(),
        m_label_offsets(),
        m_label_names(),
        m_label_ids(),
        m_int_literals(),
        m_text_literals(),
        m_constant_heap(std::make_unique<Heap>()),
        m_constants(),
        m_scope_names(),
        m_symbols(),
        m_entry_label(),
        m_entry_argc(0),
        m_is_linked(false)
    {
        m_exps.reserve(reserved_exp_count);
    }

    //
    // Labels:
    //

    LabelID VCode::label(std::string const& name) {
        auto it = m_label_ids.find(name);
        if (it != m_label_ids.end()) {
            return it->second;
        }
        LabelID id = m_label_names.size();
        m_label_names.push_back(name);
        m_label_offsets.push_back({});
        m_label_ids[name] = id;
        return id;
    }

    void VCode::define_label(LabelID label) {
        if (m_label_offsets[label].has_value()) {
            error("Label defined twice: " + m_label_names[label]);
            throw FatalError();
        }
        m_label_offsets[label] = m_exps.size();
    }

    LiteralID VCode::intern_text_literal(std::string text) {
        LiteralID id = m_text_literals.size();
        m_text_literals.push_back(std::move(text));
        return id;
    }

    //
    // Creating VM expressions:
    //

    std::pair<VmExpID, VmExp&> VCode::help_new_vmx(VmExpKind kind) {
        if (m_is_linked) {
            error("Cannot append instructions to a linked image");
            throw FatalError();
        }
        VmExpID exp_id = m_exps.size();
        VmExp& exp_ref = m_exps.emplace_back(kind);
        return {exp_id, exp_ref};
    }

    VmExpID VCode::new_vmx_create_int(mpz_class const& value) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateInt);
        if (mpz_fits_slong_p(value.get_mpz_t()) && OBJECT::int_fits_inline(value.get_si())) {
            exp.args.i_create_int.inline_raw = OBJECT::make_int(value.get_si()).as_raw();
            exp.args.i_create_int.literal = 0;
        } else {
            exp.args.i_create_int.inline_raw = 0;
            exp.args.i_create_int.literal = m_int_literals.size();
            m_int_literals.push_back(value);
        }
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_text(std::string text) {
        LiteralID literal = intern_text_literal(std::move(text));
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateText);
        exp.args.i_create_text.literal = literal;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_symbol(SymbolID symbol) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateSymbol);
        exp.args.i_create_symbol.symbol = symbol;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_tag(SymbolID symbol) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateTag);
        exp.args.i_create_tag.symbol = symbol;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_list(size_t n) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateList);
        exp.args.i_create_list.n = n;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_struct(size_t n) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateStruct);
        exp.args.i_create_struct.n = n;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_function(LabelID body, size_t captured_count, size_t argc) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateFunction);
        exp.args.i_create_function.body = body;
        exp.args.i_create_function.body_x = 0;
        exp.args.i_create_function.captured_count = captured_count;
        exp.args.i_create_function.argc = argc;
        return exp_id;
    }
    VmExpID VCode::new_vmx_create_builtin(BuiltinID builtin) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::CreateBuiltin);
        exp.args.i_create_builtin.builtin = builtin;
        return exp_id;
    }
    VmExpID VCode::new_vmx_push_constant(ConstantID constant) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::PushConstant);
        exp.args.i_push_constant.constant = constant;
        return exp_id;
    }
    VmExpID VCode::new_vmx_pop() {
        return help_new_vmx(VmExpKind::Pop).first;
    }
    VmExpID VCode::new_vmx_push_from_stack(size_t offset) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::PushFromStack);
        exp.args.i_push_from_stack.offset = offset;
        return exp_id;
    }
    VmExpID VCode::new_vmx_pop_multiple_below_top(size_t n) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::PopMultipleBelowTop);
        exp.args.i_pop_multiple_below_top.n = n;
        return exp_id;
    }
    VmExpID VCode::new_vmx_call(size_t argc) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::Call);
        exp.args.i_call.argc = argc;
        return exp_id;
    }
    VmExpID VCode::new_vmx_tail_call(size_t locals, size_t argc) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::TailCall);
        exp.args.i_tail_call.locals = locals;
        exp.args.i_tail_call.argc = argc;
        return exp_id;
    }
    VmExpID VCode::new_vmx_return() {
        return help_new_vmx(VmExpKind::Return).first;
    }
    VmExpID VCode::new_vmx_duplicate(size_t offset, size_t amount) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::Duplicate);
        exp.args.i_duplicate.offset = offset;
        exp.args.i_duplicate.amount = amount;
        return exp_id;
    }
    VmExpID VCode::new_vmx_drop(size_t offset) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::Drop);
        exp.args.i_drop.offset = offset;
        return exp_id;
    }
    VmExpID VCode::new_vmx_enter_needs_scope(ScopeID scope, size_t argc) {
        auto [exp_id, exp] = help_new_vmx(VmExpKind::EnterNeedsScope);
        exp.args.i_enter_needs_scope.scope = scope;
        exp.args.i_enter_needs_scope.argc = argc;
        return exp_id;
    }
    VmExpID VCode::new_vmx_exit_needs_scope() {
        return help_new_vmx(VmExpKind::ExitNeedsScope).first;
    }
    VmExpID VCode::new_vmx_needs(std::string reason) {
        LiteralID literal = intern_text_literal(std::move(reason));
        auto [exp_id, exp] = help_new_vmx(VmExpKind::Needs);
        exp.args.i_needs.reason = literal;
        return exp_id;
    }
    VmExpID VCode::new_vmx_panic(std::string reason) {
        LiteralID literal = intern_text_literal(std::move(reason));
        auto [exp_id, exp] = help_new_vmx(VmExpKind::Panic);
        exp.args.i_panic.reason = literal;
        return exp_id;
    }

    //
    // Constants:
    //

    ConstantID VCode::define_constant_int(mpz_class const& value) {
        OBJECT it;
        if (mpz_fits_slong_p(value.get_mpz_t()) && OBJECT::int_fits_inline(value.get_si())) {
            it = OBJECT::make_int(value.get_si());
        } else {
            it = HeapInt::create(*m_constant_heap, false, value).to_object();
        }
        m_constants.push_back(it);
        return m_constants.size() - 1;
    }
    ConstantID VCode::define_constant_text(std::string const& text) {
        m_constants.push_back(HeapText::create(*m_constant_heap, false, text).to_object());
        return m_constants.size() - 1;
    }
    ConstantID VCode::define_constant_symbol(SymbolID symbol) {
        m_constants.push_back(OBJECT::make_symbol(symbol));
        return m_constants.size() - 1;
    }
    ConstantID VCode::define_constant_foreign_id(Word id) {
        m_constants.push_back(HeapForeignId::create(*m_constant_heap, false, id).to_object());
        return m_constants.size() - 1;
    }

    //
    // Needs scopes, entry point:
    //

    void VCode::define_scope(ScopeID scope, std::string name) {
        m_scope_names[scope] = std::move(name);
    }

    std::optional<std::string> VCode::scope_name(ScopeID scope) const {
        auto it = m_scope_names.find(scope);
        if (it == m_scope_names.end()) {
            return {};
        }
        return {it->second};
    }

    void VCode::set_entry(LabelID label, size_t argc) {
        m_entry_label = label;
        m_entry_argc = argc;
    }

    std::optional<VmExpID> VCode::entry_offset() const {
        if (!m_entry_label.has_value()) {
            return {};
        }
        return m_label_offsets[*m_entry_label];
    }

    //
    // Linking:
    //

    void VCode::link() {
        if (m_is_linked) {
            return;
        }
        for (LabelID label = 0; label < m_label_offsets.size(); label++) {
            if (!m_label_offsets[label].has_value()) {
                error("Cannot link: label '" + m_label_names[label] + "' is used but never defined");
                throw FatalError();
            }
        }
        for (VmExpID exp_id = 0; exp_id < m_exps.size(); exp_id++) {
            VmExp& exp = m_exps[exp_id];
            std::stringstream problem;
            switch (exp.kind) {
                case VmExpKind::CreateFunction: {
                    exp.args.i_create_function.body_x = *m_label_offsets[exp.args.i_create_function.body];
                } break;
                case VmExpKind::CreateBuiltin: {
                    if (exp.args.i_create_builtin.builtin >= BUILTIN_COUNT) {
                        problem << "unknown builtin index " << exp.args.i_create_builtin.builtin;
                    }
                } break;
                case VmExpKind::CreateSymbol:
                case VmExpKind::CreateTag: {
                    SymbolID symbol = (exp.kind == VmExpKind::CreateSymbol ? exp.args.i_create_symbol.symbol : exp.args.i_create_tag.symbol);
                    if (!m_symbols.contains(symbol)) {
                        problem << "unknown symbol ID " << symbol;
                    }
                } break;
                case VmExpKind::PushConstant: {
                    if (exp.args.i_push_constant.constant >= m_constants.size()) {
                        problem << "unknown constant " << exp.args.i_push_constant.constant;
                    }
                } break;
                default: {
                } break;
            }
            if (!problem.str().empty()) {
                std::stringstream ss;
                ss << "Cannot link instruction (" << exp_id << ") " << vmx_mnemonic(exp.kind) << ": " << problem.str();
                error(ss.str());
                throw FatalError();
            }
        }
        m_is_linked = true;
    }

    //
    // Dump:
    //

    void VCode::dump(std::ostream& out) const {
        out << "=== VCode ===" << std::endl;
        out << "instructions: " << m_exps.size() << ", constants: " << m_constants.size()
            << ", symbols: " << m_symbols.size() << std::endl;
        if (m_entry_label.has_value()) {
            out << "entry: " << m_label_names[*m_entry_label] << "/" << m_entry_argc << std::endl;
        }

        // labels may share an offset
        std::multimap<VmExpID, LabelID> labels_by_offset;
        for (LabelID label = 0; label < m_label_offsets.size(); label++) {
            if (m_label_offsets[label].has_value()) {
                labels_by_offset.insert({*m_label_offsets[label], label});
            }
        }
        for (VmExpID exp_id = 0; exp_id < m_exps.size(); exp_id++) {
            auto range = labels_by_offset.equal_range(exp_id);
            for (auto it = range.first; it != range.second; ++it) {
                out << m_label_names[it->second] << ":" << std::endl;
            }
            out << "    (" << exp_id << ") ";
            print_one_exp(exp_id, out);
            out << std::endl;
        }
    }

    void VCode::print_one_exp(VmExpID exp_id, std::ostream& out) const {
        VmExp const& exp = m_exps[exp_id];
        out << vmx_mnemonic(exp.kind);
        switch (exp.kind) {
            case VmExpKind::CreateInt: {
                if (exp.args.i_create_int.inline_raw != 0) {
                    out << ' ' << OBJECT{exp.args.i_create_int.inline_raw}.as_int();
                } else {
                    out << ' ' << m_int_literals[exp.args.i_create_int.literal];
                }
            } break;
            case VmExpKind::CreateText: {
                out << ' ';
                print_text_literal(m_text_literals[exp.args.i_create_text.literal], out);
            } break;
            case VmExpKind::CreateSymbol: {
                out << ' ' << m_symbols.name(exp.args.i_create_symbol.symbol);
            } break;
            case VmExpKind::CreateTag: {
                out << ' ' << m_symbols.name(exp.args.i_create_tag.symbol);
            } break;
            case VmExpKind::CreateList: {
                out << ' ' << exp.args.i_create_list.n;
            } break;
            case VmExpKind::CreateStruct: {
                out << ' ' << exp.args.i_create_struct.n;
            } break;
            case VmExpKind::CreateFunction: {
                out << ' ' << m_label_names[exp.args.i_create_function.body]
                    << ' ' << exp.args.i_create_function.captured_count
                    << ' ' << exp.args.i_create_function.argc;
                if (m_is_linked) {
                    out << " ; @" << exp.args.i_create_function.body_x;
                }
            } break;
            case VmExpKind::CreateBuiltin: {
                BuiltinID builtin = exp.args.i_create_builtin.builtin;
                if (builtin < BUILTIN_COUNT) {
                    out << ' ' << builtin_name(builtin);
                } else {
                    out << " #" << builtin;
                }
            } break;
            case VmExpKind::PushConstant: {
                out << ' ' << exp.args.i_push_constant.constant;
                if (exp.args.i_push_constant.constant < m_constants.size()) {
                    out << " ; ";
                    print_obj(m_constants[exp.args.i_push_constant.constant], m_symbols, out);
                }
            } break;
            case VmExpKind::PushFromStack: {
                out << ' ' << exp.args.i_push_from_stack.offset;
            } break;
            case VmExpKind::PopMultipleBelowTop: {
                out << ' ' << exp.args.i_pop_multiple_below_top.n;
            } break;
            case VmExpKind::Call: {
                out << ' ' << exp.args.i_call.argc;
            } break;
            case VmExpKind::TailCall: {
                out << ' ' << exp.args.i_tail_call.locals << ' ' << exp.args.i_tail_call.argc;
            } break;
            case VmExpKind::Duplicate: {
                out << ' ' << exp.args.i_duplicate.offset << ' ' << exp.args.i_duplicate.amount;
            } break;
            case VmExpKind::Drop: {
                out << ' ' << exp.args.i_drop.offset;
            } break;
            case VmExpKind::EnterNeedsScope: {
                out << ' ' << exp.args.i_enter_needs_scope.scope << ' ' << exp.args.i_enter_needs_scope.argc;
                auto name = scope_name(exp.args.i_enter_needs_scope.scope);
                if (name.has_value()) {
                    out << " ; " << *name;
                }
            } break;
            case VmExpKind::Needs: {
                out << ' ';
                print_text_literal(m_text_literals[exp.args.i_needs.reason], out);
            } break;
            case VmExpKind::Panic: {
                out << ' ';
                print_text_literal(m_text_literals[exp.args.i_panic.reason], out);
            } break;
            case VmExpKind::Pop:
            case VmExpKind::Return:
            case VmExpKind::ExitNeedsScope: {
            } break;
        }
    }

}   // namespace ndl
