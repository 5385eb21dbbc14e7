#ifndef SHELLAC_PARSER_HPP
#define SHELLAC_PARSER_HPP

#include <algorithm>
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "param.hpp"
#include "utils.hpp"

namespace shellac {

// Option parser. Produces raw (unconverted) values; Command turns them into typed params.
// Parsing stops at the first usage error; the result then holds whatever was collected before it.
class Parser {
public:
    struct Options {
        bool allowInterspersedArgs{true};
        bool ignoreUnknownOptions{false};
        std::function<std::string(std::string)> normalizeToken{};
    };

    struct Result {
        // Option dest -> values. Repeated non-multiple options keep the last occurrence.
        std::unordered_map<std::string, std::vector<std::string>> options;
        // Argument name -> values; nullopt when nothing was supplied.
        std::unordered_map<std::string, std::optional<std::vector<std::string>>> arguments;
        std::vector<std::string> largs;
    };

    Parser() : Parser(Options{}) {}
    explicit Parser(Options options) : options_(std::move(options)) {}

    void addOption(const Option& opt) {
        const std::string dest = opt.name();
        auto registerSpelling = [&](const std::string& spelling, std::string constValue) {
            const auto opt_ = normalizeOpt(spelling);
            const auto [prefix, value] = splitOpt(opt_);
            prefixes_.insert(prefix.substr(0, 1));

            Spec spec;
            spec.dest = dest;
            spec.nargs = opt.isFlag() ? 0 : opt.nargs();
            if (opt.isFlag()) {
                spec.action = opt.multiple() ? Action::AppendConst : Action::StoreConst;
                spec.constValue = std::move(constValue);
            } else {
                spec.action = opt.multiple() ? Action::Append : Action::Store;
            }

            knownOpts_.push_back(opt_);
            if (prefix.size() == 1 && value.size() == 1) {
                shortOpts_[opt_] = std::move(spec);
            } else {
                prefixes_.insert(prefix);
                longOpts_[opt_] = std::move(spec);
            }
        };

        for (const auto& o : opt.opts()) registerSpelling(o, "true");
        for (const auto& o : opt.secondaryOpts()) registerSpelling(o, "false");
    }

    void addArgument(const Argument& arg) { arguments_.push_back({arg.name(), arg.nargs()}); }

    Result parse(std::vector<std::string> args) {
        ok_ = true;
        error_.clear();

        State state;
        state.rargs.assign(std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
        try {
            processArgsForOptions(state);
            processArgsForArgs(state);
        } catch (const Failure& f) {
            ok_ = false;
            error_ = f.message;
        }
        return std::move(state.result);
    }

    bool ok() const { return ok_; }
    const std::string& error() const { return error_; }

private:
    enum class Action {
        Store,
        Append,
        StoreConst,
        AppendConst,
    };

    struct Spec {
        std::string dest;
        int nargs{1};
        Action action{Action::Store};
        std::string constValue;
    };

    struct ArgumentSpec {
        std::string name;
        int nargs{1};
    };

    struct State {
        std::deque<std::string> rargs;
        Result result;
    };

    struct Failure {
        std::string message;
    };

    [[noreturn]] static void fail(std::string message) { throw Failure{std::move(message)}; }

    std::string normalizeOpt(const std::string& opt) const {
        if (!options_.normalizeToken) return opt;
        auto [prefix, value] = splitOpt(opt);
        return prefix + options_.normalizeToken(std::move(value));
    }

    bool isOptionPrefix(std::string_view s) const { return prefixes_.count(std::string(s)) != 0; }

    void processArgsForOptions(State& state) {
        while (!state.rargs.empty()) {
            std::string arg = std::move(state.rargs.front());
            state.rargs.pop_front();

            if (arg == "--") return;
            if (arg.size() > 1 && isOptionPrefix(std::string_view(arg).substr(0, 1))) {
                processOpts(arg, state);
            } else if (options_.allowInterspersedArgs) {
                state.result.largs.push_back(std::move(arg));
            } else {
                state.rargs.push_front(std::move(arg));
                return;
            }
        }
    }

    void processOpts(const std::string& arg, State& state) {
        std::optional<std::string> explicitValue;
        std::string longOpt = arg;
        if (const auto eq = arg.find('='); eq != std::string::npos) {
            longOpt = arg.substr(0, eq);
            explicitValue = arg.substr(eq + 1);
        }
        const auto normLongOpt = normalizeOpt(longOpt);

        if (const auto it = longOpts_.find(normLongOpt); it != longOpts_.end()) {
            matchLongOpt(normLongOpt, it->second, explicitValue, state);
            return;
        }

        // A two-character prefix ("--foo") never falls back to short-option clustering.
        if (!isOptionPrefix(std::string_view(arg).substr(0, 2))) {
            matchShortOpt(arg, state);
            return;
        }
        if (!options_.ignoreUnknownOptions) failNoSuchOption(normLongOpt);
        state.result.largs.push_back(arg);
    }

    void matchLongOpt(const std::string& opt, const Spec& spec, const std::optional<std::string>& explicitValue, State& state) {
        std::vector<std::string> values;
        if (spec.nargs > 0) {
            if (explicitValue) state.rargs.push_front(*explicitValue);
            values = valueFromState(opt, spec, state);
        } else if (explicitValue) {
            fail(opt + " option does not take a value");
        }
        processOption(spec, std::move(values), state);
    }

    void matchShortOpt(const std::string& arg, State& state) {
        const char prefix = arg[0];
        std::string unknown;

        for (std::size_t pos = 1; pos < arg.size(); ++pos) {
            const auto opt = normalizeOpt(std::string{prefix, arg[pos]});
            const auto it = shortOpts_.find(opt);
            if (it == shortOpts_.end()) {
                if (options_.ignoreUnknownOptions) {
                    unknown.push_back(arg[pos]);
                    continue;
                }
                failNoSuchOption(opt);
            }

            const Spec& spec = it->second;
            bool stop = false;
            std::vector<std::string> values;
            if (spec.nargs > 0) {
                // Remaining characters ("-ovalue") are the next value.
                if (pos + 1 < arg.size()) {
                    state.rargs.push_front(arg.substr(pos + 1));
                    stop = true;
                }
                values = valueFromState(opt, spec, state);
            }
            processOption(spec, std::move(values), state);
            if (stop) break;
        }

        if (options_.ignoreUnknownOptions && !unknown.empty()) state.result.largs.push_back(std::string(1, prefix) + unknown);
    }

    static std::vector<std::string> valueFromState(const std::string& opt, const Spec& spec, State& state) {
        const auto n = static_cast<std::size_t>(spec.nargs);
        if (state.rargs.size() < n) {
            if (n == 1) fail(opt + " option requires an argument");
            fail(opt + " option requires " + std::to_string(n) + " arguments");
        }
        std::vector<std::string> values(std::make_move_iterator(state.rargs.begin()),
                                        std::make_move_iterator(state.rargs.begin() + static_cast<std::ptrdiff_t>(n)));
        state.rargs.erase(state.rargs.begin(), state.rargs.begin() + static_cast<std::ptrdiff_t>(n));
        return values;
    }

    static void processOption(const Spec& spec, std::vector<std::string> values, State& state) {
        auto& slot = state.result.options[spec.dest];
        switch (spec.action) {
            case Action::Store: slot = std::move(values); break;
            case Action::Append: slot.insert(slot.end(), values.begin(), values.end()); break;
            case Action::StoreConst: slot = {spec.constValue}; break;
            case Action::AppendConst: slot.push_back(spec.constValue); break;
        }
    }

    // Distributes positionals over the declared arguments. Arguments after an unbounded one are
    // filled from the end, so `cp SRC... DST` works.
    void processArgsForArgs(State& state) {
        std::deque<std::string> pool(state.result.largs.begin(), state.result.largs.end());
        pool.insert(pool.end(), state.rargs.begin(), state.rargs.end());

        using Slot = std::vector<std::optional<std::string>>;
        std::deque<const ArgumentSpec*> specs;
        for (const auto& a : arguments_) specs.push_back(&a);

        std::vector<std::pair<const ArgumentSpec*, Slot>> slots;
        std::optional<std::size_t> starPos;

        auto fetchValue = [&]() -> std::optional<std::string> {
            if (pool.empty()) return std::nullopt;
            std::string v;
            if (!starPos) {
                v = std::move(pool.front());
                pool.pop_front();
            } else {
                v = std::move(pool.back());
                pool.pop_back();
            }
            return v;
        };

        while (!specs.empty()) {
            const ArgumentSpec* spec = nullptr;
            if (!starPos) {
                spec = specs.front();
                specs.pop_front();
            } else {
                spec = specs.back();
                specs.pop_back();
            }

            if (spec->nargs == 1) {
                slots.push_back({spec, Slot{fetchValue()}});
            } else if (spec->nargs > 1) {
                Slot s;
                for (int i = 0; i < spec->nargs; ++i) s.push_back(fetchValue());
                if (starPos) std::reverse(s.begin(), s.end());
                slots.push_back({spec, std::move(s)});
            } else {
                starPos = slots.size();
                slots.push_back({spec, Slot{}});
            }
        }

        if (starPos) {
            auto& star = slots[*starPos].second;
            for (auto& v : pool) star.emplace_back(std::move(v));
            pool.clear();
            std::reverse(slots.begin() + static_cast<std::ptrdiff_t>(*starPos) + 1, slots.end());
        }

        for (auto& [spec, slot] : slots) {
            std::optional<std::vector<std::string>> value;
            if (spec->nargs < 0) {
                std::vector<std::string> all;
                for (auto& v : slot) all.push_back(std::move(*v));
                value = std::move(all);
            } else {
                const auto holes = static_cast<std::size_t>(std::count(slot.begin(), slot.end(), std::nullopt));
                if (holes != 0 && holes != slot.size()) {
                    fail("argument " + spec->name + " takes " + std::to_string(spec->nargs) + " values");
                }
                if (holes == 0) {
                    std::vector<std::string> all;
                    for (auto& v : slot) all.push_back(std::move(*v));
                    value = std::move(all);
                }
            }
            state.result.arguments[spec->name] = std::move(value);
        }

        state.result.largs.assign(std::make_move_iterator(pool.begin()), std::make_move_iterator(pool.end()));
        state.rargs.clear();
    }

    [[noreturn]] void failNoSuchOption(const std::string& opt) const {
        std::string msg = "no such option: " + opt;
        const auto suggestions = utils::suggest(opt, knownOpts_);
        if (!suggestions.empty()) {
            msg += " (Possible options: ";
            for (std::size_t i = 0; i < suggestions.size(); ++i) {
                if (i) msg += ", ";
                msg += suggestions[i];
            }
            msg += ")";
        }
        fail(std::move(msg));
    }

    std::unordered_map<std::string, Spec> longOpts_;
    std::unordered_map<std::string, Spec> shortOpts_;
    std::vector<ArgumentSpec> arguments_;
    std::set<std::string> prefixes_{"-", "--"};
    std::vector<std::string> knownOpts_;
    bool ok_{true};
    std::string error_;
    Options options_;
};

} // namespace shellac

#endif // SHELLAC_PARSER_HPP
