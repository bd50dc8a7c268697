#pragma once

#include <string>
#include <vector>
#include <memory>

#include "execution_types.h"

namespace gradebox {

// One independent static check over submitted source text.
// Advisory only: a rule never influences grading.
class HintRule {
public:
    virtual ~HintRule() = default;

    // Stable identifier reported in hints_triggered
    virtual std::string id() const = 0;

    virtual bool matches(const std::string& code, const std::vector<TestCase>& test_cases) const = 0;
};

class HintAnalyzer {
public:
    // Analyzer with no rules; see with_default_rules()
    HintAnalyzer() = default;

    static HintAnalyzer with_default_rules();

    void add_rule(std::unique_ptr<HintRule> rule);

    // Identifiers of matching rules, in rule order. Rules that throw are skipped.
    std::vector<std::string> analyze(const std::string& code,
                                     const std::vector<TestCase>& test_cases) const;

    size_t rule_count() const { return rules_.size(); }

private:
    std::vector<std::unique_ptr<HintRule>> rules_;
};

// Built-in rules
std::unique_ptr<HintRule> make_infinite_loop_rule();
std::unique_ptr<HintRule> make_missing_return_rule();
std::unique_ptr<HintRule> make_input_not_converted_rule();
std::unique_ptr<HintRule> make_python2_print_rule();
std::unique_ptr<HintRule> make_assignment_in_condition_rule();
std::unique_ptr<HintRule> make_no_output_rule();

} // namespace gradebox
