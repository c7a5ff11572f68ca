#include "sampler/ClassificationRules.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

using namespace latmon;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static void lower_all(std::vector<std::string>& v) {
    for (auto& s : v) s = lower(s);
}

ClassificationRules::ClassificationRules(std::vector<ClassificationRule> rules) {
    rules_.reserve(rules.size());
    for (auto& r : rules) {
        Compiled c;
        lower_all(r.name_equals);
        lower_all(r.name_contains);
        lower_all(r.cmdline_contains);
        if (!r.pattern.empty()) {
            try {
                c.regex = std::regex(r.pattern, std::regex::ECMAScript | std::regex::icase);
                c.has_regex = true;
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("rule '" + r.label + "': bad pattern: " + e.what());
            }
        }
        c.rule = std::move(r);
        rules_.push_back(std::move(c));
    }
}

ClassificationRules ClassificationRules::defaults() {
    std::vector<ClassificationRule> rules;

    {
        ClassificationRule r;
        r.label         = "editor";
        r.component     = ComponentClass::EDITOR;
        r.name_equals   = {"code", "code-oss", "codium"};
        r.name_contains = {"code-server", "code.exe"};
        rules.push_back(r);
    }
    {
        ClassificationRule r;
        r.label            = "extension-host";
        r.component        = ComponentClass::EXTENSION_HOST;
        r.name_contains    = {"extensionhost"};
        r.cmdline_contains = {"extensionhost"};
        rules.push_back(r);
    }
    {
        ClassificationRule r;
        r.label            = "copilot";
        r.component        = ComponentClass::AI_MODEL_REMOTE;
        r.name_contains    = {"copilot"};
        r.cmdline_contains = {"github.copilot", "copilot-agent"};
        rules.push_back(r);
    }
    for (const char* model : {"ollama", "llama", "gpt4all", "localai"}) {
        ClassificationRule r;
        r.label            = std::string("local-model:") + model;
        r.component        = ComponentClass::AI_MODEL_LOCAL;
        r.name_contains    = {model};
        r.cmdline_contains = {model};
        rules.push_back(r);
    }
    {
        // Idle shells are noise: only report terminals doing work.
        ClassificationRule r;
        r.label           = "terminal";
        r.component       = ComponentClass::TERMINAL;
        r.name_equals     = {"bash", "zsh", "fish", "sh"};
        r.name_contains   = {"terminal", "konsole"};
        r.min_cpu_percent = 0.1;
        rules.push_back(r);
    }

    return ClassificationRules(std::move(rules));
}

ClassificationRules ClassificationRules::for_component(ComponentClass c) const {
    ClassificationRules out;
    for (const auto& r : rules_) {
        if (r.rule.component == c) out.rules_.push_back(r);
    }
    return out;
}

const ClassificationRule* ClassificationRules::match(const ProcessInfo& p) const {
    if (rules_.empty()) return nullptr;

    const std::string name = lower(p.name);
    const std::string cmd  = lower(p.cmdline);

    for (const auto& c : rules_) {
        const ClassificationRule& r = c.rule;

        if (r.min_cpu_percent > 0.0 && !(p.cpu_percent > r.min_cpu_percent)) continue;

        bool hit = std::find(r.name_equals.begin(), r.name_equals.end(), name)
                   != r.name_equals.end();

        for (size_t i = 0; !hit && i < r.name_contains.size(); ++i) {
            hit = name.find(r.name_contains[i]) != std::string::npos;
        }
        for (size_t i = 0; !hit && i < r.cmdline_contains.size(); ++i) {
            hit = cmd.find(r.cmdline_contains[i]) != std::string::npos;
        }
        if (!hit && c.has_regex) {
            hit = std::regex_search(p.name + " " + p.cmdline, c.regex);
        }

        if (hit) return &r;
    }
    return nullptr;
}
