#ifndef GOLDEN_RESULTS_HH
#define GOLDEN_RESULTS_HH

#include <array>
#include <base/Base.hh>
#include <base/FS.hh>
#include <diff.hh>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace golden {
using namespace base;

struct DiagsHandler;

/// The stored expectation matches the generated text.
struct Correct {
    bool operator==(const Correct&) const = default;
};

/// There is no expectation file yet.
struct Missing {
    /// Text that would become the new expectation.
    std::string generated;
    bool operator==(const Missing&) const = default;
};

/// The expectation file differs from the generated text.
struct Mismatch {
    std::string generated;
    std::string stored;
    bool operator==(const Mismatch&) const = default;
};

/// Result of comparing a test’s output against its expectation.
using Outcome = std::variant<Correct, Missing, Mismatch>;

/// What a user can filter by. Do NOT reorder these without also
/// updating the CategoryTags array below.
enum struct OutcomeCategory : u8 {
    Fail,    ///< Mismatch
    Pass,    ///< Correct
    Missing, ///< Missing
};

/// Tags used to report each category.
inline constexpr std::array<std::string_view, 3> CategoryTags{
    "fail",
    "pass",
    "miss",
};

/// Parse the argument of the '--only' option.
auto ParseOutcomeCategory(std::string_view s) -> std::optional<OutcomeCategory>;

/// Get the category of an outcome.
auto CategoryOf(const Outcome& o) -> OutcomeCategory;

/// Format the result of running a test into an expect string.
///
/// The expect string is of the form
///
/// \code
///     ---CODE---
///     <exit code>
///     ---STDOUT---
///     <contents of STDOUT>---STDERR---
///     <contents of STDERR>
/// \endcode
///
/// Nothing is escaped, so output that itself contains one of the
/// markers yields a string that can’t be split back into its parts.
/// That’s fine since expect strings are only ever compared.
auto Format(int status, std::string_view stdout_text, std::string_view stderr_text) -> std::string;

/// Get the path of the expect file of a test.
auto ExpectPath(const fs::Path& test) -> fs::Path;

/// Compare generated output against the stored expectation, if any.
auto Classify(std::string generated, std::optional<std::string> stored) -> Outcome;

/// Read an expect file.
///
/// \return The file contents, or nullopt if the file doesn’t exist.
auto ReadExpectation(const fs::Path& path) -> Result<std::optional<std::string>>;

/// Outcome of a single test.
class TestResult {
    fs::Path test_path;
    int exit_status;
    std::string out;
    std::string err;
    Outcome outcome;

public:
    /// Parts of the report of a test.
    struct Report {
        OutcomeCategory category;
        std::string identity;

        /// Generated text or diff; empty if there is nothing to show.
        std::string details;
    };

    TestResult(fs::Path path, int status, std::string stdout_text, std::string stderr_text, Outcome outcome)
        : test_path(std::move(path)),
          exit_status(status),
          out(std::move(stdout_text)),
          err(std::move(stderr_text)),
          outcome(std::move(outcome)) {}

    /// Classify the output of a test against its expect file.
    ///
    /// \return An error if the expect file exists but can’t be read.
    static auto Create(
        fs::Path path,
        int status,
        std::string stdout_text,
        std::string stderr_text
    ) -> Result<TestResult>;

    [[nodiscard]] auto path() const -> const fs::Path& { return test_path; }
    [[nodiscard]] auto status() const -> int { return exit_status; }
    [[nodiscard]] auto stdout_text() const -> std::string_view { return out; }
    [[nodiscard]] auto stderr_text() const -> std::string_view { return err; }
    [[nodiscard]] auto state() const -> const Outcome& { return outcome; }
    [[nodiscard]] auto category() const -> OutcomeCategory { return CategoryOf(outcome); }

    /// Write the generated expectation to the expect file.
    ///
    /// Does nothing if the test passed.
    auto save_results() const -> Result<>;

    /// Split the report of this test into its parts.
    [[nodiscard]] auto report(bool show_diff, const DiffEngine& diff = GenDiff) const -> Report;

    /// Get the report line of this test, without any colours.
    [[nodiscard]] auto report_str(bool show_diff, const DiffEngine& diff = GenDiff) const -> std::string;
};

/// Result of running a test suite.
class SuiteResult {
    std::string suite_name;
    std::vector<TestResult> test_results;
    std::vector<std::string> suite_errors;

public:
    /// Number of results by category.
    struct Counts {
        usz passed{};
        usz failed{};
        usz missing{};
        usz errors{};
    };

    explicit SuiteResult(
        std::string name,
        std::vector<TestResult> results = {},
        std::vector<std::string> errors = {}
    ) : suite_name(std::move(name)),
        test_results(std::move(results)),
        suite_errors(std::move(errors)) {}

    [[nodiscard]] auto name() const -> std::string_view { return suite_name; }
    [[nodiscard]] auto results() const -> const std::vector<TestResult>& { return test_results; }
    [[nodiscard]] auto errors() const -> const std::vector<std::string>& { return suite_errors; }
    [[nodiscard]] auto counts() const -> Counts;

    /// Keep only the results in a category; errors are always kept.
    ///
    /// \param only The category to keep, or nullopt to keep everything.
    [[nodiscard]] auto filter(std::optional<OutcomeCategory> only) && -> SuiteResult;

    /// Print the suite name, the report of every test, and any errors.
    ///
    /// \param dh Where to print to.
    /// \param total_tests Number of tests in the suite before filtering.
    /// \param show_diff Whether to show diffs.
    /// \param diff The diff engine to use.
    void print(
        DiagsHandler& dh,
        usz total_tests,
        bool show_diff,
        const DiffEngine& diff = GenDiff
    ) &&;
};

/// Collects the results of tests that finish in any order.
///
/// Every test is assigned a slot by its index in discovery order,
/// so the suite result is ordered no matter which test finishes first.
class SuiteCollector {
    std::string suite_name;
    std::vector<std::optional<TestResult>> slots;
    std::vector<std::string> suite_errors;
    std::mutex errors_mutex;

public:
    SuiteCollector(std::string name, usz test_count)
        : suite_name(std::move(name)), slots(test_count) {}

    /// Store the result of the test at \p index.
    ///
    /// Distinct indices may be set concurrently.
    void set(usz index, TestResult result);

    /// Record that a test could not be run at all.
    void add_error(std::string message);

    /// Get the ordered suite result. Empty slots are skipped.
    [[nodiscard]] auto finish() && -> SuiteResult;
};
} // namespace golden

#endif // GOLDEN_RESULTS_HH
