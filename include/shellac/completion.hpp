#ifndef SHELLAC_COMPLETION_HPP
#define SHELLAC_COMPLETION_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "command.hpp"
#include "context.hpp"
#include "param.hpp"

namespace shellac {

// Some shells split `--opt=value` at this character before handing the words over.
inline constexpr std::string_view kWordBreak = "=";

[[nodiscard]] bool startsOption(std::string_view token);

// True if `param` is a non-flag option still taking values. Scans the last nargs words of
// `allArgs` backwards; the last option-like word seen must be one of the option's spellings.
[[nodiscard]] bool optionAwaitingValue(const std::vector<std::string>& allArgs, const Parameter& param);

// True if `param` is an argument that can still take a value given what was parsed so far.
[[nodiscard]] bool argumentAwaitingValue(const Context::Params& params, const Parameter& param);

// Replays `args` through the command tree with resilient parsing and returns the innermost
// context. The returned context owns its parent chain.
[[nodiscard]] std::unique_ptr<Context> resolveContext(const Command& cli, const std::string& progName, std::vector<std::string> args);

enum class CompletionKind {
    OptionName,
    OptionValue,
    ArgumentValue,
    CommandName,
};

struct PartialValue {
    CompletionKind kind{CompletionKind::CommandName};
    // The option or argument whose values are completed; null for names.
    const Parameter* param{nullptr};
};

// Splits a word-break `--opt=val` incomplete token: "--opt" is appended to `args` and "val" is
// returned. A lone "=" becomes empty.
[[nodiscard]] std::string normalizeIncomplete(std::vector<std::string>& args, std::string incomplete);

// Decides what the incomplete token completes in `ctx`. Option names are not offered once
// `hasDoubleDash` is set.
[[nodiscard]] PartialValue resolvePartialValue(const Context& ctx,
                                               const std::vector<std::string>& allArgs,
                                               std::string_view incomplete,
                                               bool hasDoubleDash);

[[nodiscard]] std::vector<Candidate> optionNameCandidates(const Context& ctx,
                                                          const std::vector<std::string>& allArgs,
                                                          std::string_view incomplete);

// Choice values filtered by prefix, otherwise whatever the parameter's completion callback
// yields. Callback exceptions propagate.
[[nodiscard]] std::vector<Candidate> valueCandidates(const Context& ctx,
                                                     const Parameter& param,
                                                     const std::vector<std::string>& allArgs,
                                                     std::string_view incomplete);

// Visible children of the active group plus the unconsumed children of chained ancestors,
// sorted and unique by value.
[[nodiscard]] std::vector<Candidate> subcommandCandidates(const Context& ctx, std::string_view incomplete);

[[nodiscard]] std::vector<Candidate> complete(const Command& cli,
                                              const std::string& progName,
                                              const std::vector<std::string>& args,
                                              std::string incomplete);

} // namespace shellac

#endif // SHELLAC_COMPLETION_HPP
