#pragma once

#include <string>

namespace gradebox {

// How actual program output is matched against the expected output
enum class CompareMode {
    TRAILING_WHITESPACE,  // CRLF -> LF, strip trailing whitespace per line and trailing blank lines
    EXACT,                // Byte-for-byte
    TRIM                  // Strip leading/trailing whitespace of the whole text
};

class OutputComparator {
public:
    explicit OutputComparator(CompareMode mode = CompareMode::TRAILING_WHITESPACE) : mode_(mode) {}

    bool matches(const std::string& actual, const std::string& expected) const;

    // Canonical form used for comparison under the configured mode
    std::string normalize(const std::string& text) const;

    CompareMode mode() const { return mode_; }

    static bool parse_mode(const std::string& name, CompareMode& mode);
    static std::string mode_to_string(CompareMode mode);

private:
    CompareMode mode_;
};

// Strip trailing whitespace (spaces, tabs, CR, LF)
std::string rtrim(const std::string& text);

// Strip leading and trailing whitespace
std::string trim(const std::string& text);

} // namespace gradebox
