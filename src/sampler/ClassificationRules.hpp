#pragma once
#include <regex>
#include <string>
#include <vector>

#include "model/Types.hpp"
#include "sampler/ProcessTable.hpp"

namespace latmon {

// One row of the pattern table. A process matches when ANY of the name /
// cmdline / pattern criteria hits and its CPU% is above min_cpu_percent
// (when that is > 0). All comparisons are case-insensitive.
struct ClassificationRule {
    std::string    label;
    ComponentClass component{ComponentClass::SYSTEM};
    SourceKind     source{SourceKind::PROCESS_SCAN};

    std::vector<std::string> name_equals;
    std::vector<std::string> name_contains;
    std::vector<std::string> cmdline_contains;
    std::string              pattern;           // ECMAScript regex over "name cmdline"

    double min_cpu_percent{0.0};
};

class ClassificationRules {
public:
    ClassificationRules() = default;

    // Throws std::invalid_argument if a pattern does not compile.
    explicit ClassificationRules(std::vector<ClassificationRule> rules);

    // Editor, extension host, remote/local AI assistants, terminals.
    static ClassificationRules defaults();

    ClassificationRules for_component(ComponentClass c) const;

    // First matching rule, nullptr if none.
    const ClassificationRule* match(const ProcessInfo& p) const;

    std::size_t size()  const { return rules_.size(); }
    bool        empty() const { return rules_.empty(); }

private:
    struct Compiled {
        ClassificationRule rule;
        bool has_regex{false};
        std::regex regex;
    };

    std::vector<Compiled> rules_;
};

} // namespace latmon
