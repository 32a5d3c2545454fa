#include <format>
#include <re.hh>

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

using namespace golden;

Regex::~Regex() noexcept {
    pcre2_code_free(reinterpret_cast<pcre2_code*>(re_ptr));
    pcre2_match_data_free(reinterpret_cast<pcre2_match_data*>(data_ptr));
}

Regex::Regex(std::string pattern) : raw(std::move(pattern)) {
    int err{};
    PCRE2_SIZE erroffs{};
    auto expr = pcre2_compile(
        reinterpret_cast<PCRE2_SPTR8>(raw.data()),
        raw.size(),
        0,
        &err,
        &erroffs,
        nullptr
    );

    /// Compilation failed.
    if (not expr) {
        std::string buffer;
        buffer.resize(4096);
        auto sz = pcre2_get_error_message(
            err,
            reinterpret_cast<PCRE2_UCHAR8*>(buffer.data()),
            buffer.size()
        );

        if (sz < 0) buffer = std::format("PCRE2 error {} at offset {}", err, erroffs);
        else buffer.resize(usz(sz));
        throw Exception{std::move(buffer)};
    }

    /// JIT-compile the RE, if possible; the interpreter is used otherwise.
    (void) pcre2_jit_compile(expr, PCRE2_JIT_COMPLETE);

    re_ptr = expr;
    data_ptr = pcre2_match_data_create_from_pattern(expr, nullptr);
}

bool Regex::match(std::string_view str) const noexcept {
    auto re = reinterpret_cast<pcre2_code*>(re_ptr);
    auto data = reinterpret_cast<pcre2_match_data*>(data_ptr);
    int code = pcre2_match(
        re,
        reinterpret_cast<PCRE2_SPTR8>(str.data()),
        str.size(),
        0,
        0,
        data,
        nullptr
    );
    return code >= 0;
}
