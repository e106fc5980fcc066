#include "ndl-core/cli.hh"

#include <string>
#include <sstream>

#include "ndl-core/feedback.hh"

namespace ndl {

    [[noreturn]] static void throw_bad_rule_error(std::string const& flag_prefix, std::string const& more) {
        std::stringstream ss;
        ss << "(Implementation error) cannot add invalid command-line rule: " << flag_prefix << ": " << more;
        error(ss.str());
        throw FatalError();
    }
    [[noreturn]] static void throw_syntax_error(std::string const& s) {
        std::stringstream ss;
        ss << "Syntax error in command-line arg: " << s;
        error(ss.str());
        throw FatalError();
    }
    [[noreturn]] static void throw_bad_opt_arg_error(std::string const& arg_name, std::string const& more) {
        std::stringstream ss;
        ss << "Bad optional command-line argument: -" << arg_name << ": " << more;
        error(ss.str());
        throw FatalError();
    }

    CliArgsParser::CliArgsParser()
    :   m_rules()
    {}

    void CliArgsParser::add_ar0_option_rule(std::string option_name, bool allow_multiple) {
        add_generic_option_rule(std::move(option_name), 0, allow_multiple);
    }
    void CliArgsParser::add_ar1_option_rule(std::string option_name, bool allow_multiple) {
        add_generic_option_rule(std::move(option_name), 1, allow_multiple);
    }
    void CliArgsParser::add_generic_option_rule(std::string name, int arity, bool allow_multiple) {
        // checking:
        if (name.empty() || name[0] == '-') {
            throw_bad_rule_error(name, "no flag name can be empty or begin with '-': '--' is a reserved token.");
        }
        for (auto const& existing_rule: m_rules) {
            if (existing_rule.name == name) {
                throw_bad_rule_error(name, "rule re-defined");
            }
        }

        // pushing:
        size_t flags = (
            (arity == 0     ? static_cast<size_t>(RuleFlag::Arity0)    : 0) |
            (arity == 1     ? static_cast<size_t>(RuleFlag::Arity1)    : 0) |
            (allow_multiple ? static_cast<size_t>(RuleFlag::CanRepeat) : 0)
        );
        m_rules.push_back(ArgRule{std::move(name), flags});
    }

    CliArgs CliArgsParser::parse(int argc, char const* argv[]) const {
        CliArgs out_args;
        bool parsed_double_dash_separator = false;
        for (int i = 1; i < argc; i++) {
            char const* s = argv[i];
            if (!parsed_double_dash_separator && (s[0] == '-' && s[1] == '-')) {
                // '--' separator
                if (s[2] != '\0') {
                    throw_syntax_error("cannot include any characters after '--' (use '-flag' for all flags, a space separator for posarg)");
                }
                parsed_double_dash_separator = true;
            }
            else if (!parsed_double_dash_separator && s[0] == '-') {
                // flag
                eat_arg(std::string{s + 1}, out_args, i, argc, argv);
            }
            else {
                // positional
                out_args.pos.emplace_back(s);
            }
        }
        return out_args;
    }

    void CliArgsParser::eat_arg(std::string const& flag_content, CliArgs& out, int& index, int argc, char const* argv[]) const {
        ArgRule const* rule = nullptr;
        for (auto const& it: m_rules) {
            if (flag_content == it.name) {
                rule = &it;
                break;
            }
        }
        if (rule == nullptr) {
            throw_bad_opt_arg_error(flag_content, "no matching optional rule is defined");
        }

        std::string const& key = rule->name;
        bool arity0 = rule->rule_flags & static_cast<size_t>(RuleFlag::Arity0);
        bool can_repeat = rule->rule_flags & static_cast<size_t>(RuleFlag::CanRepeat);
        if (arity0) {
            auto it = out.ar0.find(key);
            if (it == out.ar0.end()) {
                out.ar0[key] = 1;
            } else if (can_repeat) {
                ++it->second;
            } else {
                throw_bad_opt_arg_error(key, "cannot repeat this flag");
            }
        }
        else {
            if (index + 1 >= argc) {
                throw_bad_opt_arg_error(key, "expected a value after this flag");
            }
            std::string val = argv[++index];
            if (out.ar1.find(key) == out.ar1.end() || can_repeat) {
                out.ar1[key] = std::move(val);
            } else {
                throw_bad_opt_arg_error(key, "multiple values provided for the same unique optional argument");
            }
        }
    }

}   // namespace ndl
