/**
 * @file test_shell.cpp
 * @brief Unit tests for the shell adapters and the completion dispatcher
 *
 * Tests cover:
 * - bash, zsh and fish response formats
 * - Activation scripts and placeholder substitution
 * - The bash version gate
 * - Adapter registry rules and the fallback for unknown shells
 * - Error reporting for missing or malformed environment variables
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <shellac/shell.hpp>

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace shellac;
using ::testing::EndsWith;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::MockFunction;
using ::testing::Not;
using ::testing::Return;
using ::testing::StartsWith;

namespace {

EnvLookup envFrom(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        const auto it = vars.find(name);
        if (it == vars.end()) return std::nullopt;
        return it->second;
    };
}

BashComplete::VersionProbe fixedBash(std::string output) {
    return [output = std::move(output)]() -> std::optional<std::string> { return output; };
}

class EchoShell : public ShellComplete {
public:
    using ShellComplete::ShellComplete;

    std::string source() const override { return "{complete_func} {script_names} {autocomplete_var}\n"; }
    bool complete() const override {
        io().out() << "echo\n";
        return true;
    }
};

} // namespace

class ShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        Command deploy("deploy", "Deploy the app.");
        deploy.withOption(Option({"--env"}).setChoices({"dev", "prod"}).setHelp("Target environment"));

        cli_.addCommand(std::move(deploy));
        cli_.addCommand(Command("destroy"));

        registry_ = ShellRegistry::withDefaults();
        registry_.add("bash", [](const Command& cli, std::string progName, std::string completeVar, ShellIo io) {
            return std::make_unique<BashComplete>(cli, std::move(progName), std::move(completeVar), std::move(io),
                                                  fixedBash("GNU bash, version 5.1.16(1)-release"));
        });
    }

    ShellIo io() {
        ShellIo io;
        io.setOut(out_).setErr(err_).setEnv(envFrom(env_));
        return io;
    }

    bool dispatch(const std::string& instruction) {
        return shellComplete(cli_, "cli", "_CLI_COMPLETE", instruction, registry_, io());
    }

    Group cli_{"cli"};
    ShellRegistry registry_;
    std::map<std::string, std::string> env_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// =============================================================================
// Responses
// =============================================================================

TEST_F(ShellTest, BashResponse) {
    env_ = {{"COMP_WORDS", "cli de"}, {"COMP_CWORD", "1"}};

    EXPECT_TRUE(dispatch("complete_bash"));
    EXPECT_EQ(out_.str(), "none,deploy\nnone,destroy\n");
    EXPECT_THAT(err_.str(), IsEmpty());
}

TEST_F(ShellTest, PlainCompleteMeansBash) {
    env_ = {{"COMP_WORDS", "cli deploy --env "}, {"COMP_CWORD", "3"}};

    EXPECT_TRUE(dispatch("complete"));
    EXPECT_EQ(out_.str(), "none,dev\nnone,prod\n");
}

TEST_F(ShellTest, ZshResponseCarriesDescriptions) {
    env_ = {{"COMP_WORDS", "cli de"}, {"COMP_CWORD", "1"}};

    EXPECT_TRUE(dispatch("complete_zsh"));
    EXPECT_EQ(out_.str(), "deploy\nDeploy the app.\ndestroy\n_\n");
}

TEST_F(ShellTest, ZshOptionNames) {
    env_ = {{"COMP_WORDS", "cli deploy --"}, {"COMP_CWORD", "2"}};

    EXPECT_TRUE(dispatch("complete_zsh"));
    EXPECT_EQ(out_.str(), "--env\nTarget environment\n--help\nShow this message and exit.\n");
}

TEST_F(ShellTest, FishDropsTheRepeatedIncompleteWord) {
    env_ = {{"COMP_WORDS", "cli de"}, {"COMP_CWORD", "de"}};

    EXPECT_TRUE(dispatch("complete_fish"));
    EXPECT_EQ(out_.str(), "none,deploy\tDeploy the app.\nnone,destroy\n");
}

TEST_F(ShellTest, FishAfterTrailingSpace) {
    env_ = {{"COMP_WORDS", "cli deploy --env"}, {"COMP_CWORD", ""}};

    EXPECT_TRUE(dispatch("complete_fish"));
    EXPECT_EQ(out_.str(), "none,dev\nnone,prod\n");
}

TEST_F(ShellTest, CursorPastLastWordCompletesEmpty) {
    env_ = {{"COMP_WORDS", "cli"}, {"COMP_CWORD", "1"}};

    EXPECT_TRUE(dispatch("complete_bash"));
    EXPECT_EQ(out_.str(), "none,deploy\nnone,destroy\n");
}

// =============================================================================
// Environment errors
// =============================================================================

TEST_F(ShellTest, MissingWordsIsReported) {
    env_ = {{"COMP_CWORD", "1"}};

    EXPECT_FALSE(dispatch("complete_zsh"));
    EXPECT_EQ(err_.str(), "Error: COMP_WORDS is not set\n");
    EXPECT_THAT(out_.str(), IsEmpty());
}

TEST_F(ShellTest, MissingCursorIsReported) {
    env_ = {{"COMP_WORDS", "cli"}};

    EXPECT_FALSE(dispatch("complete_fish"));
    EXPECT_EQ(err_.str(), "Error: COMP_CWORD is not set\n");
}

TEST_F(ShellTest, MalformedCursorIsReported) {
    env_ = {{"COMP_WORDS", "cli"}, {"COMP_CWORD", "x1"}};

    EXPECT_FALSE(dispatch("complete_bash"));
    EXPECT_EQ(err_.str(), "Error: invalid COMP_CWORD: x1\n");
}

// =============================================================================
// Dispatch
// =============================================================================

TEST_F(ShellTest, UnknownInstructionDoesNothing) {
    EXPECT_FALSE(dispatch("bogus"));
    EXPECT_FALSE(dispatch("bogus_zsh"));
    EXPECT_THAT(out_.str(), IsEmpty());
    EXPECT_THAT(err_.str(), IsEmpty());
}

TEST_F(ShellTest, UnknownShellFallsBackToBaseAdapter) {
    EXPECT_FALSE(dispatch("source_tcsh"));
    EXPECT_EQ(err_.str(), "Error: source function needs to be overridden\n");

    err_.str("");
    EXPECT_FALSE(dispatch("complete_tcsh"));
    EXPECT_EQ(err_.str(), "Error: complete function needs to be overridden\n");
}

TEST_F(ShellTest, SourcePrintsScript) {
    EXPECT_TRUE(dispatch("source_zsh"));
    EXPECT_THAT(out_.str(), StartsWith("#compdef cli\n"));
    EXPECT_THAT(out_.str(), EndsWith("compdef _cli_completion cli;\n"));
}

TEST_F(ShellTest, CustomAdapter) {
    registry_.add<EchoShell>("echo");

    EXPECT_TRUE(dispatch("source_echo"));
    EXPECT_EQ(out_.str(), "_cli_completion cli _CLI_COMPLETE;\n");

    out_.str("");
    EXPECT_TRUE(dispatch("complete_echo"));
    EXPECT_EQ(out_.str(), "echo\n");
}

TEST_F(ShellTest, CompleteFromEnvironment) {
    EXPECT_EQ(completeFromEnvironment(cli_, "cli", registry_, io()), std::nullopt);

    env_ = {{"_CLI_COMPLETE", "complete_zsh"}, {"COMP_WORDS", "cli dep"}, {"COMP_CWORD", "1"}};
    EXPECT_EQ(completeFromEnvironment(cli_, "cli", registry_, io()), 0);
    EXPECT_EQ(out_.str(), "deploy\nDeploy the app.\n");

    env_ = {{"_CLI_COMPLETE", "complete_zsh"}};
    EXPECT_EQ(completeFromEnvironment(cli_, "cli", registry_, io()), 1);

    env_ = {{"_CLI_COMPLETE", ""}};
    EXPECT_EQ(completeFromEnvironment(cli_, "cli", registry_, io()), std::nullopt);
}

// =============================================================================
// Scripts
// =============================================================================

TEST(CompletionScript, Naming) {
    EXPECT_EQ(completionFunctionName("foo-bar baz_blah"), "_foo_barbaz_blah_completion");
    EXPECT_EQ(defaultCompleteVar("foo-bar"), "_FOO_BAR_COMPLETE");
    EXPECT_EQ(defaultCompleteVar("cli"), "_CLI_COMPLETE");
}

TEST(CompletionScript, BashScript) {
    const Command cli("foo-bar baz_blah");
    ShellRegistry registry;
    registry.add("bash", [](const Command& c, std::string progName, std::string completeVar, ShellIo io) {
        return std::make_unique<BashComplete>(c, std::move(progName), std::move(completeVar), std::move(io), fixedBash("version 4.4.0"));
    });

    const auto script = getCompletionScript(cli, "foo-bar baz_blah", "_COMPLETE_VAR", "bash", registry);

    EXPECT_THAT(script, StartsWith("_foo_barbaz_blah_completion() {"));
    EXPECT_THAT(script, HasSubstr("_COMPLETE_VAR=complete $1"));
    EXPECT_THAT(script, HasSubstr("complete -o nosort -F _foo_barbaz_blah_completion foo-bar baz_blah"));
    EXPECT_THAT(script, EndsWith("_foo_barbaz_blah_completion_setup;"));
    EXPECT_THAT(script, Not(HasSubstr("{complete_func}")));
    EXPECT_THAT(script, Not(HasSubstr("{autocomplete_var}")));
}

TEST(CompletionScript, ZshScript) {
    const Command cli("foo-bar");
    const auto script = getCompletionScript(cli, "foo-bar", "_FOO_BAR_COMPLETE", "zsh", ShellRegistry::withDefaults());

    EXPECT_THAT(script, StartsWith("#compdef foo-bar"));
    EXPECT_THAT(script, HasSubstr("compdef _foo_bar_completion foo-bar;"));
    EXPECT_THAT(script, HasSubstr("(( ! $+commands[foo-bar] )) && return 1"));
    EXPECT_THAT(script, HasSubstr("_FOO_BAR_COMPLETE=\"complete_zsh\""));
}

TEST(CompletionScript, FishScript) {
    const Command cli("foo-bar");
    const auto script = getCompletionScript(cli, "foo-bar", "_FOO_BAR_COMPLETE", "fish", ShellRegistry::withDefaults());

    EXPECT_THAT(script, StartsWith("function _foo_bar_completion_complete;"));
    EXPECT_THAT(script, HasSubstr("env _FOO_BAR_COMPLETE=complete_fish"));
    EXPECT_THAT(script, EndsWith("--arguments \"(_foo_bar_completion_complete)\";"));
}

// =============================================================================
// Bash version gate
// =============================================================================

TEST(BashVersion, OldVersionsAreRejected) {
    EXPECT_TRUE(bashVersionNotUsable(fixedBash("GNU bash, version 3.2.57(1)-release (x86_64-apple-darwin)")));
    EXPECT_TRUE(bashVersionNotUsable(fixedBash("GNU bash, version 4.3.48(1)-release")));
}

TEST(BashVersion, RecentVersionsAreAccepted) {
    EXPECT_FALSE(bashVersionNotUsable(fixedBash("GNU bash, version 4.4.0(1)-release")));
    EXPECT_FALSE(bashVersionNotUsable(fixedBash("GNU bash, version 5.1.16(1)-release")));
}

TEST(BashVersion, UnknownVersionDoesNotBlock) {
    EXPECT_FALSE(bashVersionNotUsable([] { return std::optional<std::string>(); }));
    EXPECT_FALSE(bashVersionNotUsable(fixedBash("no version here")));
    EXPECT_FALSE(bashVersionNotUsable(BashComplete::VersionProbe()));
}

TEST(BashVersion, SourceChecksTheProbe) {
    const Command cli("cli");
    MockFunction<std::optional<std::string>()> probe;
    EXPECT_CALL(probe, Call()).WillOnce(Return(std::optional<std::string>("GNU bash, version 3.2.57(1)-release")));

    const BashComplete bash(cli, "cli", "_CLI_COMPLETE", {}, probe.AsStdFunction());
    EXPECT_THROW((void)bash.source(), UnsupportedShellError);
}

TEST(BashVersion, OldBashIsReportedBySource) {
    const Command cli("cli");
    ShellRegistry registry;
    registry.add("bash", [](const Command& c, std::string progName, std::string completeVar, ShellIo io) {
        return std::make_unique<BashComplete>(c, std::move(progName), std::move(completeVar), std::move(io),
                                              fixedBash("GNU bash, version 3.2.57(1)-release"));
    });
    std::ostringstream out;
    std::ostringstream err;
    ShellIo io;
    io.setOut(out).setErr(err);

    EXPECT_FALSE(shellComplete(cli, "cli", "_CLI_COMPLETE", "source", registry, io));
    EXPECT_EQ(err.str(), "Error: Shell completion is not supported for bash versions older than 4.4\n");
    EXPECT_THAT(out.str(), IsEmpty());
}

// =============================================================================
// Registry
// =============================================================================

TEST(ShellRegistry, Defaults) {
    const auto registry = ShellRegistry::withDefaults();

    EXPECT_THAT(registry.names(), ::testing::ElementsAre("bash", "fish", "zsh"));
    EXPECT_TRUE(registry.contains("zsh"));
    EXPECT_FALSE(registry.contains("tcsh"));
}

TEST(ShellRegistry, RejectsInvalidEntries) {
    ShellRegistry registry;

    EXPECT_THROW(registry.add<ZshComplete>(""), std::invalid_argument);
    EXPECT_THROW(registry.add("zsh", ShellRegistry::Factory()), std::invalid_argument);
    EXPECT_TRUE(registry.names().empty());
}

TEST(ShellRegistry, FactoryMustProduceAnAdapter) {
    const Command cli("cli");
    ShellRegistry registry;
    registry.add("null", [](const Command&, std::string, std::string, ShellIo) { return std::unique_ptr<ShellComplete>(); });

    EXPECT_THROW((void)registry.create("null", cli, "cli", "_CLI_COMPLETE"), std::invalid_argument);
}

TEST(ShellRegistry, LaterEntryReplacesEarlier) {
    const Command cli("cli");
    auto registry = ShellRegistry::withDefaults();
    registry.add<EchoShell>("zsh");

    const auto adapter = registry.create("zsh", cli, "cli", "_CLI_COMPLETE");
    EXPECT_NE(dynamic_cast<const EchoShell*>(adapter.get()), nullptr);
}

TEST(ShellRegistry, UnknownNameGivesBaseAdapter) {
    const Command cli("cli");
    const auto adapter = ShellRegistry::withDefaults().create("tcsh", cli, "cli", "_CLI_COMPLETE");

    ASSERT_NE(adapter, nullptr);
    EXPECT_THROW((void)adapter->source(), NotImplementedError);
    EXPECT_THROW((void)adapter->complete(), NotImplementedError);
}
