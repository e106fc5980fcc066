#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>

#include "ndl-core/assembler.hh"
#include "ndl-core/cli.hh"
#include "ndl-core/config.hh"
#include "ndl-core/feedback.hh"
#include "ndl-core/printing.hh"
#include "ndl-core/refcount.hh"
#include "ndl-core/vm.hh"

namespace ndl {

    struct NdlRunArgs {
        std::string image_path;
        size_t max_stack_depth;
        size_t max_heap_words;
        bool trace;
        bool dump;
        bool help;
    };

    static size_t parse_size_arg(CliArgs const& raw, std::string const& name, size_t default_value) {
        auto it = raw.ar1.find(name);
        if (it == raw.ar1.end()) {
            return default_value;
        }
        char* end = nullptr;
        unsigned long long value = strtoull(it->second.c_str(), &end, 10);
        if (it->second.empty() || *end != '\0') {
            std::stringstream ss;
            ss << "Expected a non-negative integer after -" << name << ", got '" << it->second << "'";
            error(ss.str());
            throw FatalError();
        }
        return static_cast<size_t>(value);
    }

    NdlRunArgs parse_cli_args(int argc, char const* argv[]) {
        CliArgsParser parser;
        parser.add_ar0_option_rule("help");
        parser.add_ar0_option_rule("trace");
        parser.add_ar0_option_rule("dump");
        parser.add_ar1_option_rule("stack-depth");
        parser.add_ar1_option_rule("heap-mib");
        CliArgs raw = parser.parse(argc, argv);

        VmOptions defaults;
        NdlRunArgs res;
        res.help = (raw.ar0.find("help") != raw.ar0.end());
        res.trace = (raw.ar0.find("trace") != raw.ar0.end());
        res.dump = (raw.ar0.find("dump") != raw.ar0.end());
        res.max_stack_depth = parse_size_arg(raw, "stack-depth", defaults.max_stack_depth);
        size_t default_heap_mib = defaults.max_heap_words * sizeof(Word) / MIBIBYTES(1);
        res.max_heap_words = MIBIBYTES(parse_size_arg(raw, "heap-mib", default_heap_mib)) / sizeof(Word);
        if (res.help) {
            return res;
        }
        if (raw.pos.size() != 1) {
            std::stringstream ss;
            ss << "Expected exactly 1 positional argument, denoting the image path: got " << raw.pos.size();
            error(ss.str());
            throw FatalError();
        }
        res.image_path = raw.pos[0];
        return res;
    }

    void print_help(std::ostream& out) {
        out << "usage: ndl-run [-help] [-trace] [-dump] [-stack-depth N] [-heap-mib N] [--] <image.ndla>" << std::endl
            << "  -help            print this message and exit" << std::endl
            << "  -trace           print each instruction as it executes" << std::endl
            << "  -dump            print the linked instruction listing before running" << std::endl
            << "  -stack-depth N   limit the stack to N slots" << std::endl
            << "  -heap-mib N      limit the heap to N MiB" << std::endl;
    }

    int run_image(NdlRunArgs const& args) {
        // Assembling:
        std::shared_ptr<VCode> code;
        {
            auto start = std::chrono::steady_clock::now();
            code = assemble_file(args.image_path);
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

#if NDL_CONFIG_DEBUG_MODE
            std::stringstream ss;
            ss << "assembling took " << duration.count() << "ms";
            info(ss.str());
#endif
        }
        if (args.dump) {
            code->dump(std::cout);
        }

        // Executing:
        VmOptions options;
        options.max_stack_depth = args.max_stack_depth;
        options.max_heap_words = args.max_heap_words;
        options.trace_instructions = args.trace;
        std::unique_ptr<VirtualMachine, void(*)(VirtualMachine*)> vm{create_vm(code, options), destroy_vm};

        RunResult result;
        {
            auto start = std::chrono::steady_clock::now();
            std::optional<OBJECT> environment;
            if (code->entry_argc() == 1) {
                environment = HeapStruct::create(vm_heap(vm.get()), true, {}).to_object();
            }
            result = vm_run_main(vm.get(), environment);
            auto end = std::chrono::steady_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

#if NDL_CONFIG_DEBUG_MODE
            std::stringstream ss;
            ss << "runtime took " << duration.count() << "ms";
            info(ss.str());
#endif
        }

        // Reporting:
        switch (result.status) {
            case RunStatus::Done: {
                print_obj(result.value, code->symbols(), std::cout);
                std::cout << std::endl;
                release(vm_heap(vm.get()), result.value);
                return 0;
            }
            case RunStatus::Panicked: {
                std::stringstream ss;
                print_panic(*result.panic, ss);
                error(ss.str());
                return 1;
            }
            case RunStatus::ResourceExhausted: {
                error("resource exhausted: " + result.exhaustion_message);
                return 3;
            }
        }
        return 1;
    }

}   // namespace ndl

int main(int argc, char const* argv[]) {
    try {
        ndl::NdlRunArgs args = ndl::parse_cli_args(argc, argv);
        if (args.help) {
            ndl::print_help(std::cout);
            return 0;
        }
        return ndl::run_image(args);
    } catch (ndl::FatalError const&) {
        return 2;
    }
}
