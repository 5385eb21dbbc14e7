#ifndef SHELLAC_SHELL_HPP
#define SHELLAC_SHELL_HPP

#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "command.hpp"

namespace shellac {

class ShellCompletionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised by adapters that do not support an operation, including the fallback for unknown shells.
class NotImplementedError : public ShellCompletionError {
public:
    using ShellCompletionError::ShellCompletionError;
};

class UnsupportedShellError : public ShellCompletionError {
public:
    using ShellCompletionError::ShellCompletionError;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// Where adapters read the environment from and write their output to.
class ShellIo {
public:
    ShellIo& setOut(std::ostream& os) {
        out_ = &os;
        return *this;
    }

    ShellIo& setErr(std::ostream& os) {
        err_ = &os;
        return *this;
    }

    ShellIo& setEnv(EnvLookup f) {
        env_ = std::move(f);
        return *this;
    }

    [[nodiscard]] std::ostream& out() const { return out_ ? *out_ : std::cout; }
    [[nodiscard]] std::ostream& err() const { return err_ ? *err_ : std::cerr; }
    [[nodiscard]] std::optional<std::string> env(const std::string& name) const;

private:
    std::ostream* out_{nullptr};
    std::ostream* err_{nullptr};
    EnvLookup env_;
};

// Adapter contract. The base class backs unknown shell names: both operations throw NotImplementedError.
class ShellComplete {
public:
    ShellComplete(const Command& cli, std::string progName, std::string completeVar, ShellIo io = {})
        : cli_(&cli),
          progName_(std::move(progName)),
          completeVar_(std::move(completeVar)),
          io_(std::move(io)) {}

    virtual ~ShellComplete() = default;

    [[nodiscard]] const Command& cli() const { return *cli_; }
    [[nodiscard]] const std::string& progName() const { return progName_; }
    [[nodiscard]] const std::string& completeVar() const { return completeVar_; }
    [[nodiscard]] const ShellIo& io() const { return io_; }

    // Activation script template. Placeholders: {complete_func}, {script_names}, {autocomplete_var}.
    [[nodiscard]] virtual std::string source() const;
    // Reads COMP_WORDS/COMP_CWORD, writes one response per candidate and returns true.
    virtual bool complete() const;

protected:
    struct CompletionRequest {
        std::vector<std::string> args;
        std::string incomplete;
    };

    // Throws ShellCompletionError when the variable is missing.
    [[nodiscard]] std::string requireEnv(const std::string& name) const;
    // words[1:cword] and words[cword] (empty past the end), the bash/zsh layout.
    [[nodiscard]] CompletionRequest cursorRequest() const;
    [[nodiscard]] std::vector<Candidate> run(const CompletionRequest& req) const;

private:
    const Command* cli_;
    std::string progName_;
    std::string completeVar_;
    ShellIo io_;
};

class BashComplete : public ShellComplete {
public:
    // Returns the output of `bash --version`, or nullopt if it could not be run.
    using VersionProbe = std::function<std::optional<std::string>()>;

    BashComplete(const Command& cli, std::string progName, std::string completeVar, ShellIo io = {}, VersionProbe probe = {});

    // Throws UnsupportedShellError for bash older than 4.4.
    [[nodiscard]] std::string source() const override;
    bool complete() const override;

private:
    VersionProbe probe_;
};

class ZshComplete : public ShellComplete {
public:
    using ShellComplete::ShellComplete;

    [[nodiscard]] std::string source() const override;
    bool complete() const override;
};

// fish exports the line up to the cursor in COMP_WORDS and the current token in COMP_CWORD.
class FishComplete : public ShellComplete {
public:
    using ShellComplete::ShellComplete;

    [[nodiscard]] std::string source() const override;
    bool complete() const override;
};

// Runs `bash --version`.
std::optional<std::string> probeBashVersion();
// True only if the probe reports a version below 4.4; an unusable probe never blocks.
bool bashVersionNotUsable(const BashComplete::VersionProbe& probe);

class ShellRegistry {
public:
    using Factory = std::function<std::unique_ptr<ShellComplete>(const Command& cli, std::string progName, std::string completeVar, ShellIo io)>;

    // bash, zsh and fish.
    static ShellRegistry withDefaults();

    // Throws std::invalid_argument for an empty name or factory. Replaces an existing entry.
    ShellRegistry& add(std::string name, Factory factory);

    template <typename T>
    ShellRegistry& add(std::string name) {
        static_assert(std::is_base_of_v<ShellComplete, T>, "shell adapters must derive from ShellComplete");
        return add(std::move(name), [](const Command& cli, std::string progName, std::string completeVar, ShellIo io) -> std::unique_ptr<ShellComplete> {
            return std::make_unique<T>(cli, std::move(progName), std::move(completeVar), std::move(io));
        });
    }

    [[nodiscard]] bool contains(const std::string& name) const { return factories_.count(name) != 0; }
    [[nodiscard]] std::vector<std::string> names() const;

    // Falls back to the base ShellComplete for unknown names.
    [[nodiscard]] std::unique_ptr<ShellComplete> create(const std::string& name,
                                                        const Command& cli,
                                                        std::string progName,
                                                        std::string completeVar,
                                                        ShellIo io = {}) const;

private:
    std::map<std::string, Factory> factories_;
};

// "_<prog>_completion" with '-' mapped to '_' and other non-identifier characters dropped.
[[nodiscard]] std::string completionFunctionName(std::string_view progName);

// "_<PROG>_COMPLETE", the variable that switches a program into completion mode.
[[nodiscard]] std::string defaultCompleteVar(std::string_view progName);

[[nodiscard]] std::string getCompletionScript(const Command& cli,
                                              const std::string& progName,
                                              const std::string& completeVar,
                                              const std::string& shell,
                                              const ShellRegistry& registry,
                                              const ShellIo& io = {});

// Handles "source", "complete", "source_<shell>" and "complete_<shell>". Returns false for any
// other instruction and for adapter errors, which are reported on io.err().
bool shellComplete(const Command& cli,
                   const std::string& progName,
                   const std::string& completeVar,
                   const std::string& instruction,
                   const ShellRegistry& registry,
                   const ShellIo& io = {});

// Exit code of the completion request named by defaultCompleteVar(progName), or nullopt when
// the variable is not set and the program should run normally.
[[nodiscard]] std::optional<int> completeFromEnvironment(const Command& cli,
                                                         const std::string& progName,
                                                         const ShellRegistry& registry,
                                                         const ShellIo& io = {});

} // namespace shellac

#endif // SHELLAC_SHELL_HPP
