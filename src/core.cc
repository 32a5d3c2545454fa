#include <algorithm>
#include <atomic>
#include <base/FS.hh>
#include <base/Text.hh>
#include <cerrno>
#include <clopts.hh>
#include <core.hh>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <errs.hh>
#include <filesystem>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace golden::detail {
using namespace command_line_options;
using options = clopts< // clang-format off
    option<"--cmd", "Command to run for each test; '%s' is replaced with the test path">,
    option<"--name", "Name of the test suite">,
    option<"--only", "Only show tests with this outcome: 'fail', 'pass', or 'missing'">,
    multiple<option<"-i", "Only run tests whose path matches this regular expression">>,
    multiple<option<"-x", "Skip tests whose path matches this regular expression">>,
    option<"-j", "Number of tests to run in parallel", std::int64_t>,
    option<"--colours", "Enable colours in output", values<"auto", "always", "never">>,
    flag<"--diff", "Show diffs of failing tests and the output of missing tests">,
    flag<"--save", "Save the output of failing and missing tests as their new expectation">,
    flag<"--stdout", "Print to stdout instead of stderr">,
    flag<"-v", "Print every command before running it">,
    multiple<positional<"tests", "Test files to run", std::string, false>>,
    help<>
>; // clang-format on
} // namespace golden::detail

using namespace golden;

/// ===========================================================================
///  Execution
/// ===========================================================================
namespace {
/// Deletes a temporary file at the end of the scope. A leftover
/// file is harmless, so failing to delete it is not an error.
struct TempFileGuard {
    const fs::Path& path;

    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};
} // namespace

auto golden::RunCommand(std::string_view cmd) -> ExecutionResult {
    return RunCommand(cmd, fs::TempPath());
}

auto golden::RunCommand(std::string_view cmd, const fs::Path& err_path) -> ExecutionResult {
    ExecutionResult er;
    TempFileGuard guard{err_path};

    /// The pipe only gives us stdout, so send stderr to a file. The
    /// newline ends any trailing comment in the command.
    auto full_cmd = std::format("( {}\n) 2>'{}'", cmd, err_path.string());
    auto pipe = popen(full_cmd.c_str(), "r");
    if (not pipe) {
        er.error_message = std::format("Failed to run command '{}': {}", cmd, std::strerror(errno));
        return er;
    }

    static constexpr usz bufsize = 4'096;
    for (;;) {
        er.stdout_text.resize(er.stdout_text.size() + bufsize);
        auto read = std::fread(er.stdout_text.data() + er.stdout_text.size() - bufsize, 1, bufsize, pipe);
        if (read < bufsize) er.stdout_text.resize(er.stdout_text.size() - (bufsize - read));
        if (std::ferror(pipe)) {
            er.error_message = std::format("Error reading output of '{}': {}", cmd, std::strerror(errno));
            pclose(pipe);
            return er;
        }
        if (std::feof(pipe)) break;
    }

    auto code = pclose(pipe);
    if (code == -1 or not WIFEXITED(code)) {
        er.error_message = std::format("Command '{}' exited abnormally", cmd);
        return er;
    }

    auto err = File::Read(err_path);
    if (not err) {
        er.error_message = std::format("Failed to read stderr of '{}': {}", cmd, err.error());
        return er;
    }

    er.stderr_text = std::string{err->view()};
    er.status = WEXITSTATUS(code);
    er.success = true;
    return er;
}

/// ===========================================================================
///  Diagnostics
/// ===========================================================================
namespace {
/// Get the name of a diagnostic.
constexpr std::string_view Name(DiagsHandler::Kind kind) {
    using Kind = DiagsHandler::Kind;
    switch (kind) {
        case Kind::Error: return "Error";
        case Kind::Warning: return "Warning";
        case Kind::Note: return "Note";
        default: return "Diagnostic";
    }
}
} // namespace

void DiagsHandler::report(Kind kind, std::string_view msg) {
    print("{}{}: ", colour(kind), Name(kind));
    print("{}{}{}\n", colour(Default), msg, colour(Reset));
}

void DiagsHandler::write(std::string_view text) {
    std::print(stream, "{}", text);
}

/// ===========================================================================
///  Driver
/// ===========================================================================
Context::Context(
    std::shared_ptr<DiagsHandler> dh,
    std::vector<fs::Path> tests,
    RunOptions opts
) : dh{std::move(dh)},
    tests(std::move(tests)),
    opts(std::move(opts)) {
    if (this->opts.jobs == 0) this->opts.jobs = 1;
    if (not this->opts.command.contains("%s")) Warning(ERR_DRV_CMD_OPT_NO_FILE, this->opts.command);
}

auto Context::SelectTests() const -> std::vector<fs::Path> {
    std::vector<fs::Path> selected;
    for (const auto& t : tests) {
        auto name = t.string();
        const auto Matches = [&](const Regex& re) { return re.match(name); };
        if (not opts.include.empty() and std::ranges::none_of(opts.include, Matches)) continue;
        if (std::ranges::any_of(opts.exclude, Matches)) continue;
        selected.push_back(t);
    }
    return selected;
}

void Context::RunTest(SuiteCollector& collector, usz index, const fs::Path& test) {
    auto cmd = str(opts.command).replace("%s", test.string());
    auto res = RunCommand(cmd);
    if (not res.success) {
        collector.add_error(std::format("{}: {}", test.string(), res.error_message));
        return;
    }

    auto tr = TestResult::Create(
        test,
        res.status,
        std::move(res.stdout_text),
        std::move(res.stderr_text)
    );

    if (not tr) {
        collector.add_error(std::format("{}: {}", test.string(), tr.error()));
        return;
    }

    collector.set(index, std::move(*tr));
}

auto Context::RunSuite(std::span<const fs::Path> selected) -> SuiteResult {
    SuiteCollector collector{opts.name, selected.size()};
    std::atomic<usz> next = 0;
    const auto Worker = [&] {
        for (;;) {
            auto i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= selected.size()) return;
            RunTest(collector, i, selected[i]);
        }
    };

    /// Wait for all workers before collecting the results.
    {
        std::vector<std::jthread> workers;
        for (usz i = 0, end = std::min(opts.jobs, selected.size()); i < end; i++)
            workers.emplace_back(Worker);
    }

    return std::move(collector).finish();
}

void Context::SaveResults(const SuiteResult& suite) {
    for (const auto& tr : suite.results()) {
        if (auto res = tr.save_results(); not res)
            Error(ERR_SAVE_FAILED, tr.path().string(), res.error());
    }
}

int Context::Run() {
    auto selected = SelectTests();
    for (const auto& t : selected)
        VerboseLog("[GOLDEN] Running command: {}\n", str(opts.command).replace("%s", t.string()));

    auto suite = RunSuite(selected);
    if (opts.save) SaveResults(suite);

    /// Print the results and a summary.
    auto counts = suite.counts();
    std::move(suite).filter(opts.only).print(*dh, selected.size(), opts.show_diff);
    dh->print(
        "{} passed, {} failed, {} missing",
        counts.passed,
        counts.failed,
        counts.missing
    );
    if (counts.errors) dh->print(", {} errors", counts.errors);
    dh->print("\n");

    return has_error or counts.failed or counts.errors ? 1 : 0;
}

int Context::RunMain(std::shared_ptr<DiagsHandler> dh, int argc, char** argv) {
    auto opts = detail::options::parse(argc, argv, dh->get_error_handler());

    /// Check if we should use colours.
    auto colours_opt = opts.get<"--colours">("auto");
    dh->stream = opts.get<"--stdout">() ? stdout : stderr;
    dh->enable_colours = colours_opt == "auto"
                           ? isatty(fileno(dh->stream))
                           : colours_opt == "always";

    if (opts.get<"-v">()) dh->report(
        DiagsHandler::Kind::Note,
        std::format("[GOLDEN] Running golden version {}", GOLDEN_VERSION)
    );

    /// We need to know how to run the tests.
    RunOptions run_opts;
    if (auto cmd = opts.get<"--cmd">(); not cmd or str(*cmd).trim().empty()) {
        dh->report(DiagsHandler::Kind::Error, ERR_DRV_CMD_OPT_MISSING);
        return 1;
    } else {
        run_opts.command = *cmd;
    }

    if (auto only = opts.get<"--only">()) {
        run_opts.only = ParseOutcomeCategory(*only);
        if (not run_opts.only) {
            dh->report(DiagsHandler::Kind::Error, ERR_DRV_ONLY_OPT_INVALID);
            return 1;
        }
    }

    if (auto j = opts.get<"-j">()) {
        if (*j <= 0) {
            dh->report(DiagsHandler::Kind::Error, ERR_DRV_JOBS_OPT_INVALID);
            return 1;
        }
        run_opts.jobs = usz(*j);
    } else {
        run_opts.jobs = std::max(1u, std::thread::hardware_concurrency());
    }

    /// Compile filters.
    const auto Compile = [&](std::span<const std::string> patterns, std::vector<Regex>& out) {
        for (const auto& p : patterns) {
            try {
                out.emplace_back(p);
            } catch (const Regex::Exception& e) {
                dh->report(DiagsHandler::Kind::Error, std::format(ERR_DRV_REGEX_INVALID, p, e.message));
                return false;
            }
        }
        return true;
    };

    if (not Compile(opts.get<"-i">(), run_opts.include)) return 1;
    if (not Compile(opts.get<"-x">(), run_opts.exclude)) return 1;

    run_opts.name = opts.get<"--name">("tests");
    run_opts.show_diff = opts.get<"--diff">();
    run_opts.save = opts.get<"--save">();
    run_opts.verbose = opts.get<"-v">();

    std::vector<fs::Path> tests;
    for (const auto& t : opts.get<"tests">()) tests.emplace_back(t);

    Context ctx{dh, std::move(tests), std::move(run_opts)};
    return ctx.Run();
}
