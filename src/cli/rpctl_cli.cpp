#include "rpctl_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/size_units.hpp>
#include <managers/process_manager.hpp>
#include <managers/run_log.hpp>
#include <managers/status_report.hpp>
#include <managers/transfer_manager.hpp>
#include <ssh/exec_session.hpp>
#include <fmt/format.h>
#include <iostream>

int exit_code_for(ErrorKind kind) {
    return kind == ErrorKind::AlreadyLocked ? EXIT_LOCKED : EXIT_ERROR;
}

static void print_console(const std::string& msg) {
    if (msg.rfind("ERROR: ", 0) == 0) {
        std::cout << theme::fail(msg.substr(7));
    } else if (msg.rfind("WARN: ", 0) == 0) {
        std::cout << theme::warn(msg.substr(6));
    } else {
        std::cout << theme::info(msg);
    }
    std::cout << std::flush;
}

static void report_failure(RunLog& log, const std::string& what, ErrorKind kind,
                           const std::string& error) {
    if (kind == ErrorKind::AlreadyLocked) {
        log.write(RunLog::Level::Info, fmt::format("{} declined: {}", what, error));
    } else {
        log.write(RunLog::Level::Error,
                  fmt::format("{} aborted ({}): {}", what, error_kind_name(kind), error));
    }
}

// ── Registration ───────────────────────────────────────────

RpctlCLI::RpctlCLI() {
    add_command("run", [](RpctlCLI& cli, const CliArgs& a) { return cli.run_local(a); },
                "Select GSMs to process that fit the local disk budget");
    add_command("transfer", [](RpctlCLI& cli, const CliArgs& a) { return cli.run_transfer(a); },
                "Transfer converted GSMs that fit the remote disk budget");
    add_command("status", [](RpctlCLI& cli, const CliArgs& a) { return cli.run_status(a); },
                "Show the pipeline stage of every GSM");
}

void RpctlCLI::add_command(const std::string& name, CommandHandler handler,
                           const std::string& help) {
    commands_[name] = {std::move(handler), help};
}

void RpctlCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    for (const auto& [name, entry] : commands_) {
        std::cout << theme::color::BLUE << fmt::format("    rpctl {:<10}", name)
                  << theme::color::RESET << theme::color::DIM << entry.second
                  << theme::color::RESET << "\n";
    }
    std::cout << theme::section("Options");
    std::cout << theme::color::DIM
              << "    --config <file>       Configuration (default ./" << DEFAULT_CONFIG_FILE << ")\n"
              << "    --ignore-disk-usage   run: admit every unfinished GSM\n"
              << "    --output <file>       run: write admitted keys, one per line\n"
              << "    --version             Show version\n"
              << "    --help                Show this help"
              << theme::color::RESET << "\n\n";
}

bool RpctlCLI::parse_args(const std::vector<std::string>& argv, size_t start,
                          CliArgs& out, std::string& error) {
    out.config_path = Config::default_config_path();
    for (size_t i = start; i < argv.size(); i++) {
        const auto& a = argv[i];
        if (a == "--config" || a == "-c") {
            if (i + 1 >= argv.size()) { error = a + " needs a file"; return false; }
            out.config_path = argv[++i];
        } else if (a == "--ignore-disk-usage") {
            out.ignore_disk_usage = true;
        } else if (a == "--output" || a == "-o") {
            if (i + 1 >= argv.size()) { error = a + " needs a file"; return false; }
            out.output_file = argv[++i];
        } else {
            error = "Unknown option: " + a;
            return false;
        }
    }
    return true;
}

int RpctlCLI::execute(const std::vector<std::string>& argv) {
    if (argv.empty() || argv[0] == "--help" || argv[0] == "-h") {
        print_usage();
        return argv.empty() ? EXIT_ERROR : EXIT_RAN;
    }
    if (argv[0] == "--version") {
        std::cout << theme::color::BROWN << theme::color::BOLD << "rpctl"
                  << theme::color::RESET << theme::color::DIM
                  << " version " RPCTL_VERSION << theme::color::RESET << "\n";
        return EXIT_RAN;
    }

    auto it = commands_.find(argv[0]);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + argv[0]);
        print_usage();
        return EXIT_ERROR;
    }

    CliArgs args;
    std::string error;
    if (!parse_args(argv, 1, args, error)) {
        std::cout << theme::fail(error);
        return EXIT_ERROR;
    }
    return it->second.first(*this, args);
}

bool RpctlCLI::require_config(const CliArgs& args) {
    if (config) return true;
    auto loaded = Config::load(args.config_path);
    if (loaded.is_err()) {
        std::cout << theme::fail(loaded.error);
        return false;
    }
    config = loaded.value;
    return true;
}

// ── Commands ───────────────────────────────────────────────

int RpctlCLI::run_local(const CliArgs& args) {
    if (!require_config(args)) return EXIT_ERROR;

    RunLog log(config->log_file(), print_console);
    ProcessManager manager(*config, log);

    RunOptions opts;
    opts.ignore_disk_usage = args.ignore_disk_usage;
    opts.output_file = args.output_file;

    auto result = manager.run_cycle(opts);
    if (result.is_err()) {
        report_failure(log, "run", result.kind, result.error);
        return exit_code_for(result.kind);
    }

    const auto& sel = result.value.selection;
    std::cout << theme::ok(fmt::format("{} of {} GSMs admitted, {} left of {}",
                                       sel.admitted.size(), result.value.discovered,
                                       format_size(sel.remaining_budget),
                                       format_size(sel.initial_budget)));
    return EXIT_RAN;
}

int RpctlCLI::run_transfer(const CliArgs& args) {
    if (!require_config(args)) return EXIT_ERROR;

    RunLog log(config->log_file(), print_console);
    auto valid = config->validate_transfer();
    if (valid.is_err()) {
        report_failure(log, "transfer", valid.kind, valid.error);
        return EXIT_ERROR;
    }

    ExecSession session(config->remote());
    TransferManager manager(*config, session, log);

    auto result = manager.run_cycle();
    session.close();
    if (result.is_err()) {
        report_failure(log, "transfer", result.kind, result.error);
        return exit_code_for(result.kind);
    }

    const auto& report = result.value;
    if (report.selection.admitted.empty()) {
        std::cout << theme::ok("Nothing to transfer");
        return EXIT_RAN;
    }
    if (report.command_exit != 0) {
        std::cout << theme::fail(fmt::format("{} failed (exit {})", report.job_name,
                                             report.command_exit));
        return EXIT_ERROR;
    }
    std::cout << theme::ok(fmt::format("{} transferred {} GSMs", report.job_name,
                                       report.selection.admitted.size()));
    return EXIT_RAN;
}

int RpctlCLI::run_status(const CliArgs& args) {
    if (!require_config(args)) return EXIT_ERROR;

    auto result = collect_status(*config);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return EXIT_ERROR;
    }

    const auto& report = result.value;
    std::cout << theme::section("GSMs");
    for (const auto& u : report.units) {
        std::string stage = stage_name(u.stage);
        std::string line = fmt::format("    {:<50} {}", u.key,
                                       u.stage == UnitStage::FullyProcessed
                                           ? theme::green(stage) : stage);
        if (u.transferred) line += theme::dim(" (transferred)");
        std::cout << line << "\n";
    }

    std::cout << theme::section("Summary");
    for (const auto& [stage, count] : report.counts) {
        std::cout << theme::kv(stage_name(stage), std::to_string(count));
    }
    std::cout << theme::kv("transferred", std::to_string(report.transferred));
    std::cout << theme::kv("total", std::to_string(report.units.size())) << "\n";
    return EXIT_RAN;
}
