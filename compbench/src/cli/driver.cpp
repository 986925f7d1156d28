#include "cli/driver.hpp"

#include "bench/interrupt.hpp"
#include "bench/invoker.hpp"
#include "bench/report.hpp"
#include "bench/test_case.hpp"
#include "bench/timed_invoker.hpp"
#include "cli/options.hpp"
#include "log/log.hpp"

#include <iostream>
#include <unistd.h>

namespace compbench::cli {

int compbench_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    auto parsed = parse_bench_args(argc, argv);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n\n";
        print_usage(std::cerr);
        return EXIT_HARNESS_FAULT;
    }
    const BenchOptions& opts = unwrap(parsed);

    if (opts.show_help) {
        print_usage();
        return EXIT_OK;
    }
    if (opts.show_version) {
        print_version();
        return EXIT_OK;
    }

    const bool use_color = !opts.no_color && isatty(STDOUT_FILENO);
    bench::ColorOutput c(use_color);

    bench::TestCaseRegistry registry = bench::default_registry().filter(opts.patterns);

    if (opts.list) {
        for (const auto& tc : registry) {
            std::cout << tc.name << "\n";
        }
        return EXIT_OK;
    }

    if (registry.empty()) {
        std::cout << c.yellow() << "No benchmarks matched the specified pattern(s)" << c.reset()
                  << "\n";
        return EXIT_OK;
    }

    auto resolved = bench::resolve_executable(opts.command.executable);
    if (!resolved) {
        COMPBENCH_LOG_ERROR("cli", "Compiler executable '" << opts.command.executable
                                                           << "' not found");
        std::cerr << "error: cannot find compiler executable '" << opts.command.executable
                  << "'\n";
        return EXIT_HARNESS_FAULT;
    }
    COMPBENCH_LOG_INFO("cli", "Using " << *resolved << ": " << opts.command.describe());

    bench::install_interrupt_handlers();

    bench::SubprocessInvoker process(opts.command);

    bench::TimedInvokerOptions timed_options;
    timed_options.warmup = opts.warmup;
    timed_options.temp_suffix = opts.temp_suffix;
    bench::TimedInvoker invoker(process, timed_options);

    bench::ReportOptions report_options;
    report_options.iterations = opts.iterations;
    report_options.timeout = std::chrono::seconds(opts.timeout_seconds);
    report_options.colors = use_color;

    bench::ReportPrinter printer(std::move(registry), invoker, report_options, std::cout);
    bench::ReportSummary summary = printer.run();

    int exit_code = EXIT_OK;
    if (!opts.json_output.empty() && !bench::save_json_report(opts.json_output, summary)) {
        std::cerr << "error: cannot write JSON summary to " << opts.json_output << "\n";
        exit_code = EXIT_HARNESS_FAULT;
    }

    log::Logger::instance().flush();

    if (summary.interrupted) {
        return EXIT_INTERRUPTED;
    }
    return exit_code;
}

} // namespace compbench::cli
