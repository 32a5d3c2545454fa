#include <core.hh>
#include <filesystem>
#include <format>
#include <results.hh>
#include <utility>

using namespace golden;

/// ===========================================================================
///  Classification
/// ===========================================================================
auto golden::ParseOutcomeCategory(std::string_view s) -> std::optional<OutcomeCategory> {
    if (s == "fail") return OutcomeCategory::Fail;
    if (s == "pass") return OutcomeCategory::Pass;
    if (s == "missing") return OutcomeCategory::Missing;
    return std::nullopt;
}

auto golden::CategoryOf(const Outcome& o) -> OutcomeCategory {
    struct Visitor {
        auto operator()(const Correct&) const { return OutcomeCategory::Pass; }
        auto operator()(const Missing&) const { return OutcomeCategory::Missing; }
        auto operator()(const Mismatch&) const { return OutcomeCategory::Fail; }
    };
    return std::visit(Visitor{}, o);
}

auto golden::Format(int status, std::string_view stdout_text, std::string_view stderr_text) -> std::string {
    std::string buf;
    buf += "---CODE---\n";
    buf += std::to_string(status);
    buf += '\n';

    buf += "---STDOUT---\n";
    buf += stdout_text;

    buf += "---STDERR---\n";
    buf += stderr_text;
    return buf;
}

auto golden::ExpectPath(const fs::Path& test) -> fs::Path {
    auto p = test;
    p.replace_extension("expect");
    return p;
}

auto golden::Classify(std::string generated, std::optional<std::string> stored) -> Outcome {
    if (not stored) return Missing{std::move(generated)};
    if (*stored == generated) return Correct{};
    return Mismatch{std::move(generated), std::move(*stored)};
}

auto golden::ReadExpectation(const fs::Path& path) -> Result<std::optional<std::string>> {
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec)) return Error("Failed to read '{}': is a directory", path.string());
    if (not File::Exists(path)) return std::nullopt;
    auto contents = File::Read(path);
    if (not contents) return Error("Failed to read '{}': {}", path.string(), contents.error());
    return std::string{contents->view()};
}

/// ===========================================================================
///  TestResult
/// ===========================================================================
auto TestResult::Create(
    fs::Path path,
    int status,
    std::string stdout_text,
    std::string stderr_text
) -> Result<TestResult> {
    auto stored = ReadExpectation(ExpectPath(path));
    if (not stored) return std::unexpected(std::move(stored.error()));
    auto outcome = Classify(Format(status, stdout_text, stderr_text), std::move(*stored));
    return TestResult{
        std::move(path),
        status,
        std::move(stdout_text),
        std::move(stderr_text),
        std::move(outcome),
    };
}

auto TestResult::save_results() const -> Result<> {
    struct Visitor {
        const fs::Path& path;
        auto operator()(const Correct&) const -> Result<> { return {}; }
        auto operator()(const Missing& m) const -> Result<> { return Write(m.generated); }
        auto operator()(const Mismatch& m) const -> Result<> { return Write(m.generated); }

        auto Write(const std::string& text) const -> Result<> {
            auto expect = ExpectPath(path);
            if (auto res = File::Write(expect, text); not res)
                return Error("Failed to write '{}': {}", expect.string(), res.error());
            return {};
        }
    };
    return std::visit(Visitor{test_path}, outcome);
}

auto TestResult::report(bool show_diff, const DiffEngine& diff) const -> Report {
    struct Visitor {
        bool show_diff;
        const DiffEngine& diff;
        auto operator()(const Correct&) const -> std::string { return {}; }
        auto operator()(const Missing& m) const -> std::string {
            return show_diff ? m.generated : std::string{};
        }

        /// The file on disk is the old version.
        auto operator()(const Mismatch& m) const -> std::string {
            return show_diff ? diff(m.stored, m.generated) : std::string{};
        }
    };

    return Report{
        category(),
        test_path.string(),
        std::visit(Visitor{show_diff, diff}, outcome),
    };
}

auto TestResult::report_str(bool show_diff, const DiffEngine& diff) const -> std::string {
    auto r = report(show_diff, diff);
    auto line = std::format("⚬ {} - {}", CategoryTags[std::to_underlying(r.category)], r.identity);
    if (not r.details.empty()) {
        line += '\n';
        line += r.details;
    }
    return line;
}

/// ===========================================================================
///  SuiteResult
/// ===========================================================================
auto SuiteResult::counts() const -> Counts {
    Counts c;
    for (const auto& tr : test_results) {
        switch (tr.category()) {
            case OutcomeCategory::Fail: c.failed++; break;
            case OutcomeCategory::Pass: c.passed++; break;
            case OutcomeCategory::Missing: c.missing++; break;
        }
    }
    c.errors = suite_errors.size();
    return c;
}

auto SuiteResult::filter(std::optional<OutcomeCategory> only) && -> SuiteResult {
    if (only) std::erase_if(test_results, [&](const TestResult& tr) { return tr.category() != *only; });
    return std::move(*this);
}

void SuiteResult::print(
    DiagsHandler& dh,
    usz total_tests,
    bool show_diff,
    const DiffEngine& diff
) && {
    auto self = std::move(*this);
    dh.print(
        "{}{}{} ({} tests)\n",
        dh.colour(DiagsHandler::Default),
        self.suite_name,
        dh.colour(DiagsHandler::Reset),
        total_tests
    );

    for (const auto& tr : self.test_results) {
        auto r = tr.report(show_diff, diff);
        auto c = dh.colour(r.category);
        dh.print(
            "  {}⚬ {} - {}{}\n",
            c,
            CategoryTags[std::to_underlying(r.category)],
            r.identity,
            dh.colour(DiagsHandler::Reset)
        );

        if (not r.details.empty()) dh.print("{}\n", r.details);
    }

    if (not self.suite_errors.empty()) {
        dh.print("  {}golden errors{}\n", dh.colour(DiagsHandler::Red, false), dh.colour(DiagsHandler::Reset));
        for (const auto& e : self.suite_errors)
            dh.print("    {}{}{}\n", dh.colour(DiagsHandler::Red, false), e, dh.colour(DiagsHandler::Reset));
    }
}

/// ===========================================================================
///  SuiteCollector
/// ===========================================================================
void SuiteCollector::set(usz index, TestResult result) {
    slots.at(index).emplace(std::move(result));
}

void SuiteCollector::add_error(std::string message) {
    std::lock_guard lock{errors_mutex};
    suite_errors.push_back(std::move(message));
}

auto SuiteCollector::finish() && -> SuiteResult {
    std::vector<TestResult> results;
    results.reserve(slots.size());
    for (auto& s : slots)
        if (s) results.push_back(std::move(*s));
    return SuiteResult{std::move(suite_name), std::move(results), std::move(suite_errors)};
}
