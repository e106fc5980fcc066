// Supports positional args, arity0 flags, and arity1 flags.
// All flags start with '-' and optionally accept a single argument in the next word.
// E.g.
// ndl-run
//  -trace                                  # an arity0 arg, name='trace'
//  -stack-depth 4096                       # an arity1 arg, name='stack-depth'
//  ./program.ndla                          # a positional arg
// NOTE:
// - '--' starts the positional-only arguments, so no flag name may begin with '-'
// - flags cannot be concatenated or abbreviated
// - more akin to PowerShell than bash

#pragma once

#include <string>
#include <vector>

#include "ndl-core/common.hh"

namespace ndl {

    using CliArity0Args = UnstableHashMap<std::string, size_t>;
    using CliArity1Args = UnstableHashMap<std::string, std::string>;
    struct CliArgs {
        std::vector<std::string> pos;
        CliArity0Args ar0;
        CliArity1Args ar1;
    };
    class CliArgsParser {
    private:
        enum class RuleFlag {
            Arity0 = 0x1,
            Arity1 = 0x2,
            CanRepeat = 0x4
        };
        struct ArgRule {
            std::string name;
            size_t rule_flags;
        };
    private:
        std::vector<ArgRule> m_rules;
    public:
        CliArgsParser();
        void add_ar0_option_rule(std::string option_name, bool allow_multiple = false);
        void add_ar1_option_rule(std::string option_name, bool allow_multiple = false);
        CliArgs parse(int argc, char const* argv[]) const;
    private:
        void add_generic_option_rule(std::string name, int arity, bool allow_multiple);
        void eat_arg(std::string const& flag_content, CliArgs& out, int& index, int argc, char const* argv[]) const;
    };

}   // namespace ndl
