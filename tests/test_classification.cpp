#include <gtest/gtest.h>

#include "sampler/ClassificationRules.hpp"
#include "TestSupport.hpp"

using namespace latmon;
using namespace latmon::test;

TEST(ClassificationRules, DefaultsRecogniseEditorProcesses) {
    auto rules = ClassificationRules::defaults().for_component(ComponentClass::EDITOR);
    EXPECT_NE(rules.match(proc(1, "code")), nullptr);
    EXPECT_NE(rules.match(proc(2, "Code")), nullptr);
    EXPECT_NE(rules.match(proc(3, "code-server")), nullptr);
    EXPECT_EQ(rules.match(proc(4, "vim")), nullptr);
    // "code" must match the whole name, not a substring.
    EXPECT_EQ(rules.match(proc(5, "barcode-scan")), nullptr);
}

TEST(ClassificationRules, ExtensionHostMatchesOnCommandLine) {
    auto rules = ClassificationRules::defaults().for_component(ComponentClass::EXTENSION_HOST);
    auto* r = rules.match(proc(10, "node", "/usr/share/code/code --type=extensionHost"));
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->label, "extension-host");
}

TEST(ClassificationRules, AiAssistantsSplitLocalAndRemote) {
    auto all = ClassificationRules::defaults();
    auto remote = all.for_component(ComponentClass::AI_MODEL_REMOTE);
    auto local  = all.for_component(ComponentClass::AI_MODEL_LOCAL);

    EXPECT_NE(remote.match(proc(1, "node", "~/.vscode/extensions/github.copilot-1.2/dist/agent.js")), nullptr);
    EXPECT_EQ(local.match(proc(1, "node", "~/.vscode/extensions/github.copilot-1.2/dist/agent.js")), nullptr);

    auto* r = local.match(proc(2, "ollama", "ollama serve"));
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->label, "local-model:ollama");
}

TEST(ClassificationRules, TerminalNeedsCpuAboveThreshold) {
    auto rules = ClassificationRules::defaults().for_component(ComponentClass::TERMINAL);
    EXPECT_EQ(rules.match(proc(1, "bash", "", 0.0)), nullptr);
    EXPECT_EQ(rules.match(proc(1, "bash", "", 0.1)), nullptr);
    EXPECT_NE(rules.match(proc(1, "bash", "", 0.5)), nullptr);
    EXPECT_NE(rules.match(proc(2, "gnome-terminal-server", "", 3.0)), nullptr);
}

TEST(ClassificationRules, RegexPatternIsCaseInsensitive) {
    ClassificationRule r;
    r.label     = "cargo";
    r.component = ComponentClass::SYSTEM;
    r.pattern   = "cargo\\s+(build|check)";
    ClassificationRules rules({r});

    EXPECT_NE(rules.match(proc(1, "cargo", "CARGO Build --release")), nullptr);
    EXPECT_EQ(rules.match(proc(1, "cargo", "cargo test")), nullptr);
}

TEST(ClassificationRules, BadPatternIsRejected) {
    ClassificationRule r;
    r.label   = "broken";
    r.pattern = "([";
    EXPECT_THROW(ClassificationRules({r}), std::invalid_argument);
}

TEST(ClassificationRules, ForComponentKeepsOnlyThatClass) {
    auto all = ClassificationRules::defaults();
    EXPECT_GT(all.size(), all.for_component(ComponentClass::EDITOR).size());
    EXPECT_TRUE(all.for_component(ComponentClass::NETWORK).empty());
}
