#ifndef GOLDEN_CORE_HH
#define GOLDEN_CORE_HH

#include <base/Base.hh>
#include <base/FS.hh>
#include <format>
#include <functional>
#include <memory>
#include <optional>
#include <print>
#include <re.hh>
#include <results.hh>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace golden {
using namespace base;
using namespace std::literals;

struct DiagsHandler {
    enum struct Kind {
        Note,    ///< Informational note.
        Warning, ///< Warning, but no hard error.
        Error,   ///< Hard error.
    };

    enum struct Colour {
        Yellow,
        Red,
        Green,
        Default,
        Reset,
    };

    using enum Colour;

    /// Whether to enable colours.
    bool enable_colours = true;

    /// What stream to print to.
    FILE* stream = stderr;

    virtual ~DiagsHandler() = default;
    virtual void write(std::string_view text);
    virtual auto get_error_handler() -> std::function<bool(std::string&&)> { return nullptr; }

    /// Get the colour of a diagnostic.
    auto colour(Kind kind) -> std::string_view {
        if (not enable_colours) return "";
        switch (kind) {
            case Kind::Warning: return colour(Yellow);
            case Kind::Note: return colour(Green);
            case Kind::Error: return colour(Red);
        }
        Unreachable("Invalid diagnostic kind");
    }

    /// Get the colour used to report a test outcome.
    auto colour(OutcomeCategory cat) -> std::string_view {
        if (not enable_colours) return "";
        switch (cat) {
            case OutcomeCategory::Fail: return colour(Red, false);
            case OutcomeCategory::Pass: return colour(Green, false);
            case OutcomeCategory::Missing: return colour(Yellow, false);
        }
        Unreachable("Invalid outcome category");
    }

    /// Get the ANSI escape sequence for a colour.
    auto colour(Colour c, bool bold = true) -> std::string_view {
        if (not enable_colours) return "";
        switch (c) {
            case Yellow: return bold ? "\033[1;33m"sv : "\033[0;33m"sv;
            case Red: return bold ? "\033[1;31m"sv : "\033[0;31m"sv;
            case Green: return bold ? "\033[1;32m"sv : "\033[0;32m"sv;
            case Default: return bold ? "\033[m\033[1m"sv : "\033[m"sv;
            case Reset: return "\033[m"sv;
        }
        Unreachable("Invalid colour");
    }

    template <typename... Args>
    void print(std::format_string<Args...> fmt, Args&&... args) {
        write(std::format(fmt, std::forward<Args>(args)...));
    }

    // This calls `write()` to print the actual diagnostic.
    void report(Kind k, std::string_view text);
};

/// Options for running a suite.
struct RunOptions {
    /// Command to run for each test; '%s' is replaced with the test path.
    std::string command;

    /// Name of the suite.
    std::string name = "tests";

    /// Only show results in this category.
    std::optional<OutcomeCategory> only;

    /// Only run tests matching at least one of these, if there are any.
    std::vector<Regex> include;

    /// Skip tests matching any of these.
    std::vector<Regex> exclude;

    /// Number of worker threads.
    usz jobs = 1;

    /// Show diffs for failed and missing tests.
    bool show_diff = false;

    /// Write new expectations for failed and missing tests.
    bool save = false;

    /// Print every command before running it.
    bool verbose = false;
};

/// Raw output of a test command.
struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::string error_message;
    int status = 0;
    bool success = false;
};

/// Run a shell command and capture its exit status and output.
///
/// \c success is only false if the command couldn’t be run to
/// completion; a nonzero exit status is still a success.
auto RunCommand(std::string_view cmd) -> ExecutionResult;

/// Run a shell command, sending its stderr through \p err_path.
///
/// The file is removed before this returns, whether or not the
/// command could be run.
auto RunCommand(std::string_view cmd, const fs::Path& err_path) -> ExecutionResult;

class Context {
    /// Diagnostics handler.
    std::shared_ptr<DiagsHandler> dh;

    /// Tests, in discovery order.
    std::vector<fs::Path> tests;

    /// How to run and report them.
    RunOptions opts;

    /// Error flag.
    bool has_error = false;

public:
    /// Run golden’s main function.
    static int RunMain(std::shared_ptr<DiagsHandler> dh, int argc, char** argv);

    /// Create a context for running a suite.
    explicit Context(
        std::shared_ptr<DiagsHandler> dh,
        std::vector<fs::Path> tests,
        RunOptions opts
    );

    /// Entry point.
    int Run();

    /// Run every selected test and collect the results.
    ///
    /// This does not print or save anything.
    auto RunSuite(std::span<const fs::Path> selected) -> SuiteResult;

    /// Get the tests that pass the include and exclude filters.
    [[nodiscard]] auto SelectTests() const -> std::vector<fs::Path>;

    template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        has_error = true;
        dh->report(DiagsHandler::Kind::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void Warning(std::format_string<Args...> fmt, Args&&... args) {
        dh->report(DiagsHandler::Kind::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void VerboseLog(std::format_string<Args...> fmt, Args&&... args) {
        if (opts.verbose) dh->write(std::format(fmt, std::forward<Args>(args)...));
    }

private:
    /// Run a single test.
    void RunTest(SuiteCollector& collector, usz index, const fs::Path& test);

    /// Save the expectations of every test in a suite.
    void SaveResults(const SuiteResult& suite);
};
} // namespace golden

#endif // GOLDEN_CORE_HH
