#include "hint_analyzer.h"
#include "output_compare.h"
#include "constants.h"

#include <regex>
#include <sstream>
#include <iostream>
#include <utility>

namespace gradebox {

namespace {

// Drop '#' comments that are not inside a string literal
std::string strip_comment(const std::string& line) {
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote != 0) {
            if (c == '\\') { ++i; continue; }
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#') {
            return line.substr(0, i);
        }
    }
    return line;
}

// std::regex recurses per character; long lines are cut before any rule sees them
std::vector<std::string> source_lines(const std::string& code) {
    std::vector<std::string> lines;
    std::istringstream stream(code);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        line = strip_comment(line);
        if (line.size() > MAX_HINT_LINE_LENGTH) {
            line.resize(MAX_HINT_LINE_LENGTH);
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

bool any_line_matches(const std::vector<std::string>& lines, const std::regex& pattern) {
    for (const auto& line : lines) {
        if (std::regex_search(line, pattern)) return true;
    }
    return false;
}

size_t indent_of(const std::string& line) {
    size_t n = line.find_first_not_of(" \t");
    return n == std::string::npos ? line.size() : n;
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

class InfiniteLoopRule : public HintRule {
public:
    std::string id() const override { return "infinite_loop"; }

    bool matches(const std::string& code, const std::vector<TestCase>&) const override {
        static const std::regex loop(R"(^\s*while\s+(True|1)\s*:)");
        static const std::regex exit_path(R"(\b(break|return|raise)\b|\bexit\s*\()");
        auto lines = source_lines(code);
        return any_line_matches(lines, loop) && !any_line_matches(lines, exit_path);
    }
};

class MissingReturnRule : public HintRule {
public:
    std::string id() const override { return "missing_return"; }

    bool matches(const std::string& code, const std::vector<TestCase>&) const override {
        static const std::regex def_line(R"(^(\s*)def\s+(\w+)\s*\()");
        static const std::regex returns(R"(\b(return|yield)\b)");
        auto lines = source_lines(code);

        for (size_t i = 0; i < lines.size(); ++i) {
            std::smatch m;
            if (!std::regex_search(lines[i], m, def_line)) continue;

            size_t def_indent = m[1].length();
            std::string name = m[2].str();
            bool has_return = false;
            for (size_t j = i + 1; j < lines.size(); ++j) {
                if (is_blank(lines[j])) continue;
                if (indent_of(lines[j]) <= def_indent) break;
                if (std::regex_search(lines[j], returns)) {
                    has_return = true;
                    break;
                }
            }
            if (has_return) continue;

            // The result is used as a value somewhere
            std::regex used(R"(([=(,+]|\breturn)\s*)" + name + R"(\s*\()");
            if (any_line_matches(lines, used)) return true;
        }
        return false;
    }
};

class InputNotConvertedRule : public HintRule {
public:
    std::string id() const override { return "input_not_converted"; }

    bool matches(const std::string& code, const std::vector<TestCase>&) const override {
        static const std::regex assign(R"(^\s*(\w+)\s*=\s*input\s*\()");
        auto lines = source_lines(code);

        for (const auto& line : lines) {
            std::smatch m;
            if (!std::regex_search(line, m, assign)) continue;
            std::string var = m[1].str();

            std::regex converted(R"(\b)" + var + R"(\s*=\s*(int|float)\s*\()");
            if (any_line_matches(lines, converted)) continue;

            std::regex arithmetic(R"(\b)" + var + R"(\s*[-+*/%]\s*\d|\d\s*[-+*/%]\s*)" + var + R"(\b)");
            if (any_line_matches(lines, arithmetic)) return true;
        }
        return false;
    }
};

class Python2PrintRule : public HintRule {
public:
    std::string id() const override { return "python2_print"; }

    bool matches(const std::string& code, const std::vector<TestCase>&) const override {
        static const std::regex statement(R"(^\s*print\s+[^\s(=.,\[])");
        return any_line_matches(source_lines(code), statement);
    }
};

class AssignmentInConditionRule : public HintRule {
public:
    std::string id() const override { return "assignment_in_condition"; }

    bool matches(const std::string& code, const std::vector<TestCase>&) const override {
        static const std::regex condition(R"(^\s*(if|elif|while)\s+(.*):\s*$)");
        static const std::regex single_equals(R"([^=!<>:]=[^=])");

        for (const auto& line : source_lines(code)) {
            std::smatch m;
            if (!std::regex_search(line, m, condition)) continue;
            // Keyword arguments inside calls are legitimate
            if (std::regex_search(top_level(m[2].str()), single_equals)) return true;
        }
        return false;
    }

private:
    // Text outside parentheses, brackets and string literals
    static std::string top_level(const std::string& text) {
        std::string out;
        int depth = 0;
        char quote = 0;
        for (size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (quote != 0) {
                if (c == '\\') { ++i; continue; }
                if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '\'') { quote = c; continue; }
            if (c == '(' || c == '[' || c == '{') { ++depth; continue; }
            if (c == ')' || c == ']' || c == '}') { if (depth > 0) --depth; continue; }
            if (depth == 0) out += c;
        }
        return " " + out + " ";
    }
};

class NoOutputRule : public HintRule {
public:
    std::string id() const override { return "no_output"; }

    bool matches(const std::string& code, const std::vector<TestCase>& test_cases) const override {
        static const std::regex writes(R"(\bprint\b|\bsys\.stdout\b)");
        bool expects_output = false;
        for (const auto& test_case : test_cases) {
            if (!trim(test_case.expected_output).empty()) {
                expects_output = true;
                break;
            }
        }
        return expects_output && !any_line_matches(source_lines(code), writes);
    }
};

} // namespace

HintAnalyzer HintAnalyzer::with_default_rules() {
    HintAnalyzer analyzer;
    analyzer.add_rule(make_infinite_loop_rule());
    analyzer.add_rule(make_missing_return_rule());
    analyzer.add_rule(make_input_not_converted_rule());
    analyzer.add_rule(make_python2_print_rule());
    analyzer.add_rule(make_assignment_in_condition_rule());
    analyzer.add_rule(make_no_output_rule());
    return analyzer;
}

void HintAnalyzer::add_rule(std::unique_ptr<HintRule> rule) {
    if (rule) {
        rules_.push_back(std::move(rule));
    }
}

std::vector<std::string> HintAnalyzer::analyze(const std::string& code,
                                               const std::vector<TestCase>& test_cases) const {
    std::vector<std::string> hints;
    for (const auto& rule : rules_) {
        try {
            if (rule->matches(code, test_cases)) {
                hints.push_back(rule->id());
            }
        } catch (const std::exception& e) {
            std::cerr << "[Hints] Rule " << rule->id() << " failed: " << e.what() << std::endl;
        }
    }
    return hints;
}

std::unique_ptr<HintRule> make_infinite_loop_rule() { return std::make_unique<InfiniteLoopRule>(); }
std::unique_ptr<HintRule> make_missing_return_rule() { return std::make_unique<MissingReturnRule>(); }
std::unique_ptr<HintRule> make_input_not_converted_rule() { return std::make_unique<InputNotConvertedRule>(); }
std::unique_ptr<HintRule> make_python2_print_rule() { return std::make_unique<Python2PrintRule>(); }
std::unique_ptr<HintRule> make_assignment_in_condition_rule() { return std::make_unique<AssignmentInConditionRule>(); }
std::unique_ptr<HintRule> make_no_output_rule() { return std::make_unique<NoOutputRule>(); }

} // namespace gradebox
