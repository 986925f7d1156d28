#include "cli/options.hpp"

#include "log/log.hpp"

#include <charconv>
#include <iostream>
#include <optional>

namespace compbench::cli {

namespace {

/// Whole-string integer parse; nullopt on trailing junk or overflow.
std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

Result<BenchOptions, std::string> parse_bench_args(int argc, char* argv[], int start_index) {
    BenchOptions opts;
    bool compiler_set = false;
    std::vector<std::string> extra_args;

    // Reads the numeric value of a "--flag=N" argument
    auto numeric = [](const std::string& arg, size_t prefix_len, int min_value,
                      int& out) -> std::optional<std::string> {
        auto value = parse_int(std::string_view(arg).substr(prefix_len));
        if (!value) {
            return "invalid number in '" + arg + "'";
        }
        if (*value < min_value) {
            return "value of '" + arg.substr(0, prefix_len - 1) + "' must be at least " +
                   std::to_string(min_value);
        }
        out = *value;
        return std::nullopt;
    };

    for (int i = start_index; i < argc; ++i) {
        std::string arg = argv[i];
        std::optional<std::string> error;

        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
        } else if (arg == "--version") {
            opts.show_version = true;
        } else if (arg == "--list") {
            opts.list = true;
        } else if (arg == "--no-color") {
            opts.no_color = true;
        } else if (arg.starts_with("--iterations=")) {
            error = numeric(arg, 13, 1, opts.iterations);
        } else if (arg.starts_with("--warmup=")) {
            error = numeric(arg, 9, 0, opts.warmup);
        } else if (arg.starts_with("--timeout=")) {
            error = numeric(arg, 10, 1, opts.timeout_seconds);
        } else if (arg.starts_with("--compiler=")) {
            opts.command.executable = arg.substr(11);
            compiler_set = true;
            if (opts.command.executable.empty()) {
                error = "--compiler needs a path";
            }
        } else if (arg.starts_with("--arg=")) {
            extra_args.push_back(arg.substr(6));
        } else if (arg.starts_with("--input-flag=")) {
            opts.command.input_flag = arg.substr(13);
        } else if (arg.starts_with("--suffix=")) {
            opts.temp_suffix = arg.substr(9);
        } else if (arg.starts_with("--json=")) {
            opts.json_output = arg.substr(7);
            if (opts.json_output.empty()) {
                error = "--json needs a path";
            }
        } else if (arg.starts_with("-")) {
            error = "unknown option '" + arg + "'";
        } else {
            opts.patterns.push_back(arg);
        }

        if (error) {
            return *error;
        }
    }

    // A custom compiler is run directly, without the cargo prefix
    if (compiler_set) {
        opts.command.args = std::move(extra_args);
    } else {
        opts.command.args.insert(opts.command.args.end(), extra_args.begin(), extra_args.end());
    }

    return opts;
}

void print_usage(std::ostream& os) {
    os << "compbench - compiler invocation benchmark harness\n"
       << "\n"
       << "Usage: compbench [options] [pattern...]\n"
       << "\n"
       << "Runs the compiler once per iteration on each built-in benchmark input and\n"
       << "reports mean, min, max, standard deviation and throughput.\n"
       << "\n"
       << "Options:\n"
       << "  --iterations=N       Measured invocations per benchmark (default: 50)\n"
       << "  --warmup=N           Unrecorded invocations before measuring (default: 0)\n"
       << "  --timeout=SECONDS    Per-invocation timeout (default: 30)\n"
       << "  --compiler=PATH      Compiler executable (default: cargo run --release\n"
       << "                       --bin react-compiler-rust --)\n"
       << "  --arg=VALUE          Extra argument before the input flag (repeatable)\n"
       << "  --input-flag=FLAG    Flag preceding the input path (default: --input)\n"
       << "  --suffix=EXT         Extension of the temporary input file (default: .js)\n"
       << "  --json=PATH          Also write a JSON summary to PATH\n"
       << "  --list               List benchmark names and exit\n"
       << "  --no-color           Disable colored output\n"
       << "  -h, --help           Show this help\n"
       << "  --version            Show version\n"
       << "\n"
       << "Logging:\n"
       << "  -v, -vv, -vvv        Info, debug, trace logging on stderr\n"
       << "  -q, --quiet          Errors only\n"
       << "  --log-level=LEVEL    trace|debug|info|warn|error|off\n"
       << "  --log-filter=SPEC    e.g. invoke=trace,*=warn\n"
       << "  --log-file=PATH      Also log to PATH\n"
       << "  --log-format=FMT     text|json\n"
       << "  COMPBENCH_LOG        Level or filter used when no flag is given\n";
}

void print_version() {
    std::cout << "compbench " << VERSION << "\n";
}

} // namespace compbench::cli
