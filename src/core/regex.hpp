#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declare PCRE2 types to avoid header pollution
struct pcre2_real_code_8;

namespace waypoint::core {

// PCRE2 wrapper used for rule matching and config validation
// Thread-safe for read operations after compilation (match data is per call)
class Regex {
public:
    // Compile a regex pattern; nullopt if compilation fails
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern);

    // Compile a regex pattern with error message
    [[nodiscard]] static std::optional<Regex> compile(std::string_view pattern,
                                                      std::string& error_message);

    // Move-only type (owns the compiled code)
    Regex(Regex&& other) noexcept;
    Regex& operator=(Regex&& other) noexcept;
    ~Regex();

    Regex(const Regex&) = delete;
    Regex& operator=(const Regex&) = delete;

    // True if the pattern matches anywhere in subject
    [[nodiscard]] bool matches(std::string_view subject) const;

    // Capture groups of the first match starting at or after `offset`.
    // Index 0 is the full match; unmatched groups are empty views.
    // Returns an empty vector when nothing matches.
    [[nodiscard]] std::vector<std::string_view> extract_groups(std::string_view subject,
                                                               size_t offset = 0) const;

    // First capture group of the first match, or nullopt
    [[nodiscard]] std::optional<std::string_view> first_capture(std::string_view subject) const;

    [[nodiscard]] std::string_view pattern() const { return pattern_; }

private:
    explicit Regex(pcre2_real_code_8* code, std::string pattern);

    pcre2_real_code_8* code_;
    std::string pattern_;
};

}  // namespace waypoint::core
