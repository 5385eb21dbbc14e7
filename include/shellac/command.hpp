#ifndef SHELLAC_COMMAND_HPP
#define SHELLAC_COMMAND_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "context.hpp"
#include "param.hpp"

namespace shellac {

class Group;

// A leaf command: ordered parameters plus the per-command context settings.
class Command {
public:
    explicit Command(std::string name, std::string help = {})
        : name_(std::move(name)),
          help_(std::move(help)) {}

    virtual ~Command() = default;

    Command(Command&&) = default;
    Command& operator=(Command&&) = default;

    Command& withOption(Option opt);
    // Throws std::invalid_argument for a second unbounded argument.
    Command& withArgument(Argument arg);

    Command& hidden(bool v = true) {
        hidden_ = v;
        return *this;
    }

    // Overrides the one-line summary otherwise derived from the help text.
    Command& shortHelp(std::string s) {
        shortHelp_ = std::move(s);
        return *this;
    }

    // Applied to option spellings and subcommand names; inherited by child contexts.
    Command& normalizeTokens(NormalizeFunc f) {
        settings_.tokenNormalizeFunc = std::move(f);
        return *this;
    }

    Command& ignoreUnknownOptions(bool v = true) {
        settings_.ignoreUnknownOptions = v;
        return *this;
    }

    Command& helpOptionNames(std::vector<std::string> names) {
        settings_.helpOptionNames = std::move(names);
        return *this;
    }

    Command& addHelpOption(bool v) {
        addHelpOption_ = v;
        return *this;
    }

    Command& allowExtraArgs(bool v = true) {
        settings_.allowExtraArgs = v;
        return *this;
    }

    Command& allowInterspersedArgs(bool v = true) {
        settings_.allowInterspersedArgs = v;
        return *this;
    }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& help() const { return help_; }
    [[nodiscard]] bool isHidden() const { return hidden_; }
    [[nodiscard]] std::string shortHelpString(std::size_t limit = 45) const;
    [[nodiscard]] const std::vector<std::unique_ptr<Parameter>>& params() const { return params_; }
    [[nodiscard]] const ContextSettings& contextSettings() const { return settings_; }
    [[nodiscard]] bool addsHelpOption() const { return addHelpOption_; }

    // Declared parameters followed by the context's help option, if it has one.
    [[nodiscard]] std::vector<const Parameter*> getParams(const Context& ctx) const;

    [[nodiscard]] virtual const Group* asGroup() const { return nullptr; }

    // Builds a context for this command and parses `args` into it. Without resilient
    // parsing a usage problem throws UsageError.
    [[nodiscard]] std::unique_ptr<Context> makeContext(std::string infoName,
                                                       std::vector<std::string> args,
                                                       std::unique_ptr<Context> parent = nullptr,
                                                       const ContextOptions& options = {}) const;

    virtual void parseArgs(Context& ctx, std::vector<std::string> args) const;

protected:
    friend class Context;

    [[nodiscard]] virtual bool defaultAllowExtraArgs() const { return false; }
    [[nodiscard]] virtual bool defaultAllowInterspersedArgs() const { return true; }

private:
    void storeValue(Context& ctx, const Parameter& param, std::optional<std::vector<std::string>> raw) const;

    std::string name_;
    std::string help_;
    std::string shortHelp_;
    bool hidden_{false};
    bool addHelpOption_{true};
    std::vector<std::unique_ptr<Parameter>> params_;
    ContextSettings settings_;
};

// A container command. Chained groups accept several subcommands in one invocation.
class Group : public Command {
public:
    struct Resolution {
        std::string name;
        const Command* command{nullptr};
        std::vector<std::string> remaining;
    };

    using Command::Command;

    Group& chain(bool v = true) {
        chain_ = v;
        return *this;
    }
    [[nodiscard]] bool isChain() const { return chain_; }

    template <typename C>
    Group& addCommand(C cmd) {
        static_assert(std::is_base_of_v<Command, C>, "addCommand requires a Command");
        return addCommand(std::unique_ptr<Command>(std::make_unique<C>(std::move(cmd))));
    }
    // Replaces an existing child of the same name.
    Group& addCommand(std::unique_ptr<Command> cmd);

    [[nodiscard]] std::vector<std::string> listCommands(const Context& ctx) const;
    [[nodiscard]] const Command* getCommand(const Context& ctx, const std::string& name) const;
    // Looks up args[0] as a child name, retrying with the context's token normalizer.
    // Outside resilient parsing an unknown name throws UsageError.
    [[nodiscard]] Resolution resolveCommand(const Context& ctx, const std::vector<std::string>& args) const;

    [[nodiscard]] const Group* asGroup() const override { return this; }

    void parseArgs(Context& ctx, std::vector<std::string> args) const override;

protected:
    [[nodiscard]] bool defaultAllowExtraArgs() const override { return true; }
    [[nodiscard]] bool defaultAllowInterspersedArgs() const override { return false; }

private:
    bool chain_{false};
    std::map<std::string, std::unique_ptr<Command>> commands_;
};

} // namespace shellac

#endif // SHELLAC_COMMAND_HPP
