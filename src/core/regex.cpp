#include "regex.hpp"

#include <memory>

// PCRE2 API - use 8-bit code units
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

namespace waypoint::core {

namespace {

struct MatchDataDeleter {
    void operator()(pcre2_match_data* data) const noexcept { pcre2_match_data_free(data); }
};

using MatchDataPtr = std::unique_ptr<pcre2_match_data, MatchDataDeleter>;

std::string describe_pcre2_error(int error_code) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(error_code, buffer, sizeof(buffer));
    return std::string(reinterpret_cast<const char*>(buffer));
}

// Run one match; returns the match data on success, null otherwise
MatchDataPtr run_match(const pcre2_code* code, std::string_view subject, size_t offset,
                       int& rc) {
    rc = PCRE2_ERROR_NOMATCH;
    if (code == nullptr || offset > subject.size()) {
        return nullptr;
    }

    MatchDataPtr data(pcre2_match_data_create_from_pattern(code, nullptr));
    if (!data) {
        return nullptr;
    }

    rc = pcre2_match(code, reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(), offset,
                     0, data.get(), nullptr);
    if (rc < 0) {
        return nullptr;
    }
    return data;
}

}  // namespace

Regex::Regex(pcre2_real_code_8* code, std::string pattern)
    : code_(code), pattern_(std::move(pattern)) {}

Regex::Regex(Regex&& other) noexcept : code_(other.code_), pattern_(std::move(other.pattern_)) {
    other.code_ = nullptr;
}

Regex& Regex::operator=(Regex&& other) noexcept {
    if (this != &other) {
        if (code_) {
            pcre2_code_free(code_);
        }
        code_ = other.code_;
        pattern_ = std::move(other.pattern_);
        other.code_ = nullptr;
    }
    return *this;
}

Regex::~Regex() {
    if (code_) {
        pcre2_code_free(code_);
    }
}

std::optional<Regex> Regex::compile(std::string_view pattern) {
    std::string ignored;
    return compile(pattern, ignored);
}

std::optional<Regex> Regex::compile(std::string_view pattern, std::string& error_message) {
    int error_code = 0;
    PCRE2_SIZE error_offset = 0;

    auto* code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), 0,
                               &error_code, &error_offset, nullptr);
    if (!code) {
        error_message = describe_pcre2_error(error_code) + " at offset " +
                        std::to_string(error_offset) + " in pattern: " + std::string(pattern);
        return std::nullopt;
    }

    return Regex(code, std::string(pattern));
}

bool Regex::matches(std::string_view subject) const {
    int rc = 0;
    return run_match(code_, subject, 0, rc) != nullptr;
}

std::vector<std::string_view> Regex::extract_groups(std::string_view subject,
                                                    size_t offset) const {
    std::vector<std::string_view> groups;

    int rc = 0;
    auto data = run_match(code_, subject, offset, rc);
    if (!data) {
        return groups;
    }

    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(data.get());
    groups.reserve(static_cast<size_t>(rc));

    // rc counts the full match plus the highest group that matched
    for (int i = 0; i < rc; ++i) {
        PCRE2_SIZE start = ovector[2 * i];
        PCRE2_SIZE end = ovector[2 * i + 1];
        if (start == PCRE2_UNSET) {
            groups.emplace_back();
        } else {
            groups.push_back(subject.substr(start, end - start));
        }
    }

    return groups;
}

std::optional<std::string_view> Regex::first_capture(std::string_view subject) const {
    auto groups = extract_groups(subject);
    if (groups.size() < 2) {
        return std::nullopt;
    }
    return groups[1];
}

}  // namespace waypoint::core
