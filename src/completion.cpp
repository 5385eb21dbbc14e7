#include "shellac/completion.hpp"

#include <algorithm>
#include <utility>
#include <variant>

#include "shellac/utils.hpp"

namespace {

static std::vector<std::string> pendingTokens(const shellac::Context& ctx) {
    std::vector<std::string> out = ctx.protectedArgs();
    out.insert(out.end(), ctx.args().begin(), ctx.args().end());
    return out;
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

namespace shellac {

bool startsOption(std::string_view token) { return !token.empty() && token.front() == '-'; }

bool optionAwaitingValue(const std::vector<std::string>& allArgs, const Parameter& param) {
    const auto* opt = dynamic_cast<const Option*>(&param);
    if (!opt || opt->isFlag()) return false;

    const std::string* lastOption = nullptr;
    int index = 0;
    for (auto it = allArgs.rbegin(); it != allArgs.rend(); ++it) {
        if (*it == kWordBreak) continue;
        if (++index > opt->nargs()) break;
        if (startsOption(*it)) lastOption = &*it;
    }
    return lastOption && contains(opt->opts(), *lastOption);
}

bool argumentAwaitingValue(const Context::Params& params, const Parameter& param) {
    if (!param.isArgument()) return false;

    const auto it = params.find(param.name());
    if (it == params.end() || !it->second) return true;
    if (param.nargs() < 0) return true;
    return param.nargs() > 1 && it->second->size() < static_cast<std::size_t>(param.nargs());
}

std::unique_ptr<Context> resolveContext(const Command& cli, const std::string& progName, std::vector<std::string> args) {
    ContextOptions resilient;
    resilient.resilientParsing = true;

    auto ctx = cli.makeContext(progName, std::move(args), nullptr, resilient);
    auto remaining = pendingTokens(*ctx);

    while (!remaining.empty()) {
        const Group* group = ctx->command().asGroup();
        if (!group) break;

        if (!group->isChain()) {
            auto res = group->resolveCommand(*ctx, remaining);
            if (!res.command) return ctx;
            ctx = res.command->makeContext(res.name, std::move(res.remaining), std::move(ctx), resilient);
            remaining = pendingTokens(*ctx);
            continue;
        }

        // Chained: every sibling hangs off the group's context; leftovers flow to the next one.
        ContextOptions chained = resilient;
        chained.allowExtraArgs = true;
        chained.allowInterspersedArgs = false;

        std::unique_ptr<Context> sub;
        while (!remaining.empty()) {
            const Context& container = sub ? *sub->parent() : *ctx;
            auto res = group->resolveCommand(container, remaining);
            if (!res.command) break;
            auto parent = sub ? sub->releaseParent() : std::move(ctx);
            sub = res.command->makeContext(res.name, std::move(res.remaining), std::move(parent), chained);
            remaining = sub->args();
        }
        if (!sub) return ctx;
        if (!remaining.empty()) return sub;

        ctx = std::move(sub);
        remaining = pendingTokens(*ctx);
    }
    return ctx;
}

std::string normalizeIncomplete(std::vector<std::string>& args, std::string incomplete) {
    if (startsOption(incomplete)) {
        const auto pos = incomplete.find(kWordBreak);
        if (pos != std::string::npos) {
            args.push_back(incomplete.substr(0, pos));
            return incomplete.substr(pos + kWordBreak.size());
        }
    } else if (incomplete == kWordBreak) {
        return {};
    }
    return incomplete;
}

PartialValue resolvePartialValue(const Context& ctx,
                                 const std::vector<std::string>& allArgs,
                                 std::string_view incomplete,
                                 bool hasDoubleDash) {
    if (!hasDoubleDash && startsOption(incomplete)) return {CompletionKind::OptionName, nullptr};

    const auto params = ctx.command().getParams(ctx);
    for (const auto* p : params) {
        if (optionAwaitingValue(allArgs, *p)) return {CompletionKind::OptionValue, p};
    }
    for (const auto* p : params) {
        if (argumentAwaitingValue(ctx.params(), *p)) return {CompletionKind::ArgumentValue, p};
    }
    return {CompletionKind::CommandName, nullptr};
}

std::vector<Candidate> optionNameCandidates(const Context& ctx,
                                            const std::vector<std::string>& allArgs,
                                            std::string_view incomplete) {
    std::vector<Candidate> out;
    for (const auto* p : ctx.command().getParams(ctx)) {
        const auto* opt = dynamic_cast<const Option*>(p);
        if (!opt || opt->hidden()) continue;

        auto offer = [&](const std::string& spelling) {
            if (contains(allArgs, spelling) && !opt->multiple()) return;
            if (utils::startsWith(spelling, incomplete)) out.push_back({spelling, opt->help()});
        };
        for (const auto& s : opt->opts()) offer(s);
        for (const auto& s : opt->secondaryOpts()) offer(s);
    }
    return out;
}

std::vector<Candidate> valueCandidates(const Context& ctx,
                                       const Parameter& param,
                                       const std::vector<std::string>& allArgs,
                                       std::string_view incomplete) {
    std::vector<Candidate> out;
    if (const auto* choices = param.type()->choices()) {
        for (const auto& c : *choices) {
            if (utils::startsWith(c, incomplete)) out.push_back({c, std::nullopt});
        }
        return out;
    }
    if (!param.completion()) return out;

    for (auto& s : param.completion()(ctx, allArgs, incomplete)) {
        if (auto* value = std::get_if<std::string>(&s)) out.push_back({std::move(*value), std::nullopt});
        else out.push_back(std::get<Candidate>(std::move(s)));
    }
    return out;
}

std::vector<Candidate> subcommandCandidates(const Context& ctx, std::string_view incomplete) {
    std::vector<Candidate> out;
    auto addVisible = [&](const Context& c, const Group& group, bool skipProtected) {
        for (const auto& name : group.listCommands(c)) {
            if (!utils::startsWith(name, incomplete)) continue;
            const Command* cmd = group.getCommand(c, name);
            if (!cmd || cmd->isHidden()) continue;
            if (skipProtected && contains(c.protectedArgs(), cmd->name())) continue;
            out.push_back({cmd->name(), cmd->shortHelpString()});
        }
    };

    if (const auto* group = ctx.command().asGroup()) addVisible(ctx, *group, false);
    for (const Context* p = ctx.parent(); p; p = p->parent()) {
        const auto* group = p->command().asGroup();
        if (group && group->isChain()) addVisible(*p, *group, true);
    }

    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end(), [](const Candidate& a, const Candidate& b) { return a.value == b.value; }), out.end());
    return out;
}

std::vector<Candidate> complete(const Command& cli,
                                const std::string& progName,
                                const std::vector<std::string>& args,
                                std::string incomplete) {
    const bool hasDoubleDash = contains(args, "--");
    std::vector<std::string> allArgs = args;
    incomplete = normalizeIncomplete(allArgs, std::move(incomplete));

    const auto ctx = resolveContext(cli, progName, allArgs);
    const auto partial = resolvePartialValue(*ctx, allArgs, incomplete, hasDoubleDash);
    switch (partial.kind) {
        case CompletionKind::OptionName: return optionNameCandidates(*ctx, allArgs, incomplete);
        case CompletionKind::OptionValue:
        case CompletionKind::ArgumentValue: return valueCandidates(*ctx, *partial.param, allArgs, incomplete);
        case CompletionKind::CommandName: break;
    }
    return subcommandCandidates(*ctx, incomplete);
}

} // namespace shellac
