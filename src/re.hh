#ifndef GOLDEN_RE_HH
#define GOLDEN_RE_HH

#include <base/Base.hh>
#include <string>
#include <string_view>
#include <utility>

namespace golden {
using namespace base;

/// PCRE2 regular expression used to select tests by path.
class Regex {
    std::string raw;
    void* re_ptr{};
    void* data_ptr{};

public:
    struct Exception : std::exception {
        std::string message;
        explicit Exception(std::string message) : message(std::move(message)) {}
        auto what() const noexcept -> const char* override { return message.c_str(); }
    };

    ~Regex() noexcept;

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    Regex(Regex&& other) noexcept
        : raw(std::move(other.raw)),
          re_ptr(std::exchange(other.re_ptr, nullptr)),
          data_ptr(std::exchange(other.data_ptr, nullptr)) {}

    Regex& operator=(Regex&& other) noexcept {
        std::swap(raw, other.raw);
        std::swap(re_ptr, other.re_ptr);
        std::swap(data_ptr, other.data_ptr);
        return *this;
    }

    /// Create a new regular expression.
    ///
    /// \param pattern The pattern to match.
    /// \throw Regex::Exception if the pattern is invalid.
    explicit Regex(std::string pattern);

    /// Search for the regular expression anywhere in a string.
    bool operator()(std::string_view str) const noexcept { return match(str); }

    /// Search for the regular expression anywhere in a string.
    ///
    /// Not thread-safe: the match data is shared by all calls.
    bool match(std::string_view str) const noexcept;

    /// Get raw text.
    [[nodiscard]] auto raw_text() const noexcept -> std::string_view { return raw; }
};
} // namespace golden

#endif // GOLDEN_RE_HH
