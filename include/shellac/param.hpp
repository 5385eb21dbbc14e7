#ifndef SHELLAC_PARAM_HPP
#define SHELLAC_PARAM_HPP

#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"

namespace shellac {

class Context;

// A completion suggestion: display value plus optional description.
struct Candidate {
    std::string value;
    std::optional<std::string> description;
};

inline bool operator==(const Candidate& a, const Candidate& b) {
    return a.value == b.value && a.description == b.description;
}

inline bool operator!=(const Candidate& a, const Candidate& b) { return !(a == b); }

inline bool operator<(const Candidate& a, const Candidate& b) {
    if (a.value != b.value) return a.value < b.value;
    return a.description.value_or("") < b.description.value_or("");
}

inline std::ostream& operator<<(std::ostream& os, const Candidate& c) {
    os << "(" << c.value << ", ";
    if (c.description) os << '"' << *c.description << '"';
    else os << "none";
    return os << ")";
}

// Dynamic completions may yield bare values or (value, description) pairs.
using Suggestion = std::variant<std::string, Candidate>;
using CompletionFunc =
    std::function<std::vector<Suggestion>(const Context& ctx, const std::vector<std::string>& args, std::string_view incomplete)>;

enum class ParamKind {
    Option,
    Argument,
};

class Parameter {
public:
    virtual ~Parameter() = default;

    [[nodiscard]] virtual ParamKind kind() const = 0;
    [[nodiscard]] bool isOption() const { return kind() == ParamKind::Option; }
    [[nodiscard]] bool isArgument() const { return kind() == ParamKind::Argument; }

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] int nargs() const { return nargs_; }
    [[nodiscard]] const ParamTypePtr& type() const { return type_; }
    [[nodiscard]] const CompletionFunc& completion() const { return completion_; }
    [[nodiscard]] const std::vector<std::string>& defaultValue() const { return default_; }
    [[nodiscard]] bool exposeValue() const { return exposeValue_; }
    [[nodiscard]] virtual bool required() const { return required_.value_or(false); }

protected:
    Parameter() = default;

    std::string name_;
    int nargs_{1};
    ParamTypePtr type_{types::string()};
    CompletionFunc completion_;
    std::vector<std::string> default_;
    bool exposeValue_{true};
    std::optional<bool> required_;
};

class Option final : public Parameter {
public:
    // Declarations: "--name", "-n", "--shout/--no-shout" for on/off pairs,
    // and an optional bare identifier that overrides the inferred name.
    explicit Option(std::vector<std::string> decls);

    [[nodiscard]] ParamKind kind() const override { return ParamKind::Option; }

    [[nodiscard]] const std::vector<std::string>& opts() const { return opts_; }
    [[nodiscard]] const std::vector<std::string>& secondaryOpts() const { return secondaryOpts_; }
    [[nodiscard]] bool isFlag() const { return isFlag_; }
    [[nodiscard]] bool multiple() const { return multiple_; }
    [[nodiscard]] bool hidden() const { return hidden_; }
    [[nodiscard]] const std::optional<std::string>& help() const { return help_; }

    Option& setHelp(std::string help) {
        help_ = std::move(help);
        return *this;
    }
    Option& setHidden(bool v = true) {
        hidden_ = v;
        return *this;
    }
    Option& setMultiple(bool v = true) {
        multiple_ = v;
        return *this;
    }
    Option& setFlag(bool v = true);
    Option& setNargs(int n);
    Option& setType(ParamTypePtr type);
    Option& setChoices(std::vector<std::string> choices) { return setType(types::choice(std::move(choices))); }
    Option& setCompletion(CompletionFunc f) {
        completion_ = std::move(f);
        return *this;
    }
    Option& setRequired(bool v = true) {
        required_ = v;
        return *this;
    }
    Option& setDefault(std::vector<std::string> values) {
        default_ = std::move(values);
        return *this;
    }
    Option& setExposeValue(bool v) {
        exposeValue_ = v;
        return *this;
    }

private:
    std::vector<std::string> opts_;
    std::vector<std::string> secondaryOpts_;
    bool isFlag_{false};
    bool multiple_{false};
    bool hidden_{false};
    std::optional<std::string> help_;
};

class Argument final : public Parameter {
public:
    static constexpr int kUnbounded = -1;

    explicit Argument(std::string name);

    [[nodiscard]] ParamKind kind() const override { return ParamKind::Argument; }
    [[nodiscard]] bool unbounded() const { return nargs_ < 0; }
    // Required unless there is a default or the argument is unbounded.
    [[nodiscard]] bool required() const override {
        if (required_) return *required_;
        return default_.empty() && nargs_ > 0;
    }

    Argument& setNargs(int n);
    Argument& setType(ParamTypePtr type);
    Argument& setChoices(std::vector<std::string> choices) { return setType(types::choice(std::move(choices))); }
    Argument& setCompletion(CompletionFunc f) {
        completion_ = std::move(f);
        return *this;
    }
    Argument& setRequired(bool v = true) {
        required_ = v;
        return *this;
    }
    Argument& setDefault(std::vector<std::string> values) {
        default_ = std::move(values);
        return *this;
    }
};

// Splits an option spelling into prefix and name: "--foo" -> {"--", "foo"}, "-f" -> {"-", "f"}.
std::pair<std::string, std::string> splitOpt(std::string_view opt);

} // namespace shellac

#endif // SHELLAC_PARAM_HPP
