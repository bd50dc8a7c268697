#include "output_compare.h"

#include <sstream>

namespace gradebox {

namespace {

const char* const WHITESPACE = " \t\r\n\f\v";

} // namespace

std::string rtrim(const std::string& text) {
    size_t end = text.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) return "";
    return text.substr(0, end + 1);
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(start, end - start + 1);
}

std::string OutputComparator::normalize(const std::string& text) const {
    switch (mode_) {
        case CompareMode::EXACT:
            return text;
        case CompareMode::TRIM:
            return trim(text);
        case CompareMode::TRAILING_WHITESPACE:
            break;
    }

    std::string result;
    result.reserve(text.size());
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        size_t end = line.find_last_not_of(WHITESPACE);
        result += (end == std::string::npos) ? std::string() : line.substr(0, end + 1);
        result += '\n';
    }

    // Trailing blank lines carry no content
    while (!result.empty() && result.back() == '\n') {
        result.pop_back();
    }
    return result;
}

bool OutputComparator::matches(const std::string& actual, const std::string& expected) const {
    return normalize(actual) == normalize(expected);
}

bool OutputComparator::parse_mode(const std::string& name, CompareMode& mode) {
    if (name == "trailing_whitespace") {
        mode = CompareMode::TRAILING_WHITESPACE;
    } else if (name == "exact") {
        mode = CompareMode::EXACT;
    } else if (name == "trim") {
        mode = CompareMode::TRIM;
    } else {
        return false;
    }
    return true;
}

std::string OutputComparator::mode_to_string(CompareMode mode) {
    switch (mode) {
        case CompareMode::TRAILING_WHITESPACE: return "trailing_whitespace";
        case CompareMode::EXACT: return "exact";
        case CompareMode::TRIM: return "trim";
    }
    return "unknown";
}

} // namespace gradebox
