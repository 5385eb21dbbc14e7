#ifndef SHELLAC_CONTEXT_HPP
#define SHELLAC_CONTEXT_HPP

#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "param.hpp"
#include "types.hpp"

namespace shellac {

class Command;

// Raised by non-resilient parsing; resilient parsing records the message on the context instead.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using NormalizeFunc = std::function<std::string(std::string)>;

// Per-command settings. Unset fields fall back to the command's own defaults or the parent context.
struct ContextSettings {
    std::optional<bool> allowExtraArgs;
    std::optional<bool> allowInterspersedArgs;
    std::optional<bool> ignoreUnknownOptions;
    std::optional<std::vector<std::string>> helpOptionNames;
    std::optional<NormalizeFunc> tokenNormalizeFunc;
};

// Per-invocation switches passed to Command::makeContext.
struct ContextOptions {
    bool resilientParsing{false};
    std::optional<bool> allowExtraArgs;
    std::optional<bool> allowInterspersedArgs;
};

class Context {
public:
    using Params = std::unordered_map<std::string, std::optional<ParamValues>>;

    Context(const Command& command, std::string infoName, std::unique_ptr<Context> parent, const ContextOptions& options);

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    [[nodiscard]] const Command& command() const { return *command_; }
    [[nodiscard]] const std::string& infoName() const { return infoName_; }
    [[nodiscard]] const Context* parent() const { return parent_.get(); }
    // Hands the parent chain back to the caller; this context becomes a root.
    std::unique_ptr<Context> releaseParent() { return std::move(parent_); }

    [[nodiscard]] const Params& params() const { return params_; }
    Params& params() { return params_; }

    [[nodiscard]] const std::vector<std::string>& args() const { return args_; }
    [[nodiscard]] const std::vector<std::string>& protectedArgs() const { return protectedArgs_; }
    void setArgs(std::vector<std::string> args) { args_ = std::move(args); }
    void setProtectedArgs(std::vector<std::string> args) { protectedArgs_ = std::move(args); }

    [[nodiscard]] bool resilientParsing() const { return resilientParsing_; }
    [[nodiscard]] bool allowExtraArgs() const { return allowExtraArgs_; }
    [[nodiscard]] bool allowInterspersedArgs() const { return allowInterspersedArgs_; }
    [[nodiscard]] bool ignoreUnknownOptions() const { return ignoreUnknownOptions_; }
    [[nodiscard]] const NormalizeFunc* tokenNormalizeFunc() const { return tokenNormalizeFunc_ ? &tokenNormalizeFunc_ : nullptr; }
    [[nodiscard]] const std::vector<std::string>& helpOptionNames() const { return helpOptionNames_; }
    [[nodiscard]] const Option* helpOption() const { return helpOption_ ? &*helpOption_ : nullptr; }

    // First usage error swallowed by resilient parsing, if any.
    [[nodiscard]] const std::optional<std::string>& error() const { return error_; }
    void recordError(std::string msg) {
        if (!error_) error_ = std::move(msg);
    }

    [[nodiscard]] std::string commandPath() const {
        if (!parent_) return infoName_;
        return parent_->commandPath() + " " + infoName_;
    }

    [[nodiscard]] const Context& root() const {
        const Context* c = this;
        while (c->parent_) c = c->parent_.get();
        return *c;
    }

    // First parsed value of a parameter, if it was supplied and converted to T.
    template <typename T>
    [[nodiscard]] std::optional<T> value(const std::string& name) const {
        const auto it = params_.find(name);
        if (it == params_.end() || !it->second || it->second->empty()) return std::nullopt;
        if (const auto* v = std::get_if<T>(&it->second->front())) return *v;
        return std::nullopt;
    }

private:
    const Command* command_;
    std::string infoName_;
    std::unique_ptr<Context> parent_;
    Params params_;
    std::vector<std::string> args_;
    std::vector<std::string> protectedArgs_;
    bool resilientParsing_{false};
    bool allowExtraArgs_{false};
    bool allowInterspersedArgs_{true};
    bool ignoreUnknownOptions_{false};
    NormalizeFunc tokenNormalizeFunc_;
    std::vector<std::string> helpOptionNames_;
    std::optional<Option> helpOption_;
    std::optional<std::string> error_;
};

} // namespace shellac

#endif // SHELLAC_CONTEXT_HPP
