#include "shellac/command.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "shellac/parser.hpp"
#include "shellac/utils.hpp"

namespace {

static std::string joinWords(const std::vector<std::string>& words) {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) out += ' ';
        out += w;
    }
    return out;
}

static std::string displayName(const shellac::Parameter& param) {
    if (const auto* opt = dynamic_cast<const shellac::Option*>(&param)) {
        if (!opt->opts().empty()) return opt->opts().front();
        if (!opt->secondaryOpts().empty()) return opt->secondaryOpts().front();
    }
    std::string upper = param.name();
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return upper;
}

} // namespace

namespace shellac {

Context::Context(const Command& command, std::string infoName, std::unique_ptr<Context> parent, const ContextOptions& options)
    : command_(&command),
      infoName_(std::move(infoName)),
      parent_(std::move(parent)),
      resilientParsing_(options.resilientParsing) {
    const auto& settings = command.contextSettings();

    if (options.allowExtraArgs) allowExtraArgs_ = *options.allowExtraArgs;
    else allowExtraArgs_ = settings.allowExtraArgs.value_or(command.defaultAllowExtraArgs());

    if (options.allowInterspersedArgs) allowInterspersedArgs_ = *options.allowInterspersedArgs;
    else allowInterspersedArgs_ = settings.allowInterspersedArgs.value_or(command.defaultAllowInterspersedArgs());

    ignoreUnknownOptions_ = settings.ignoreUnknownOptions.value_or(false);

    if (settings.tokenNormalizeFunc) tokenNormalizeFunc_ = *settings.tokenNormalizeFunc;
    else if (parent_) tokenNormalizeFunc_ = parent_->tokenNormalizeFunc_;

    if (settings.helpOptionNames) helpOptionNames_ = *settings.helpOptionNames;
    else if (parent_) helpOptionNames_ = parent_->helpOptionNames_;
    else helpOptionNames_ = {"--help"};

    if (command.addsHelpOption() && !helpOptionNames_.empty()) {
        Option help(helpOptionNames_);
        help.setFlag().setHelp("Show this message and exit.").setExposeValue(false);
        helpOption_ = std::move(help);
    }
}

Command& Command::withOption(Option opt) {
    params_.push_back(std::make_unique<Option>(std::move(opt)));
    return *this;
}

Command& Command::withArgument(Argument arg) {
    if (arg.unbounded()) {
        const bool hasUnbounded = std::any_of(params_.begin(), params_.end(), [](const std::unique_ptr<Parameter>& p) {
            return p->isArgument() && p->nargs() < 0;
        });
        if (hasUnbounded) throw std::invalid_argument("command " + name_ + ": only one argument may take an unbounded number of values");
    }
    params_.push_back(std::make_unique<Argument>(std::move(arg)));
    return *this;
}

std::string Command::shortHelpString(std::size_t limit) const {
    if (!shortHelp_.empty()) return shortHelp_;
    return utils::makeDefaultShortHelp(help_, limit);
}

std::vector<const Parameter*> Command::getParams(const Context& ctx) const {
    std::vector<const Parameter*> out;
    out.reserve(params_.size() + 1);
    for (const auto& p : params_) out.push_back(p.get());
    if (const auto* help = ctx.helpOption()) out.push_back(help);
    return out;
}

std::unique_ptr<Context> Command::makeContext(std::string infoName,
                                              std::vector<std::string> args,
                                              std::unique_ptr<Context> parent,
                                              const ContextOptions& options) const {
    auto ctx = std::make_unique<Context>(*this, std::move(infoName), std::move(parent), options);
    parseArgs(*ctx, std::move(args));
    return ctx;
}

void Command::parseArgs(Context& ctx, std::vector<std::string> args) const {
    Parser::Options po;
    po.allowInterspersedArgs = ctx.allowInterspersedArgs();
    po.ignoreUnknownOptions = ctx.ignoreUnknownOptions();
    if (const auto* normalize = ctx.tokenNormalizeFunc()) po.normalizeToken = *normalize;

    Parser parser(std::move(po));
    const auto params = getParams(ctx);
    for (const auto* p : params) {
        if (const auto* opt = dynamic_cast<const Option*>(p)) parser.addOption(*opt);
        else if (const auto* arg = dynamic_cast<const Argument*>(p)) parser.addArgument(*arg);
    }

    auto result = parser.parse(std::move(args));
    if (!parser.ok()) {
        if (!ctx.resilientParsing()) throw UsageError(parser.error());
        ctx.recordError(parser.error());
    }

    for (const auto* p : params) {
        std::optional<std::vector<std::string>> raw;
        if (p->isOption()) {
            if (const auto it = result.options.find(p->name()); it != result.options.end()) raw = it->second;
        } else if (const auto it = result.arguments.find(p->name()); it != result.arguments.end()) {
            raw = it->second;
        }
        storeValue(ctx, *p, std::move(raw));
    }

    if (!result.largs.empty() && !ctx.allowExtraArgs() && !ctx.resilientParsing()) {
        const char* noun = result.largs.size() == 1 ? "argument" : "arguments";
        throw UsageError(std::string("Got unexpected extra ") + noun + " (" + joinWords(result.largs) + ")");
    }
    ctx.setArgs(std::move(result.largs));
}

// Converts raw tokens through the parameter type. Resilient contexts record none for anything
// missing or unconvertible and skip defaults.
void Command::storeValue(Context& ctx, const Parameter& param, std::optional<std::vector<std::string>> raw) const {
    if (!param.exposeValue()) return;
    auto& slot = ctx.params()[param.name()];

    if ((!raw || raw->empty()) && !ctx.resilientParsing()) {
        if (!param.defaultValue().empty()) {
            raw = param.defaultValue();
        } else if (param.required()) {
            const char* kind = param.isOption() ? "option" : "argument";
            throw UsageError(std::string("Missing ") + kind + " \"" + displayName(param) + "\".");
        }
    }
    if (!raw) {
        slot = std::nullopt;
        return;
    }

    ParamValues values;
    values.reserve(raw->size());
    for (const auto& token : *raw) {
        ParamValue v;
        if (const auto err = param.type()->convert(token, v)) {
            if (!ctx.resilientParsing()) throw UsageError("Invalid value for \"" + displayName(param) + "\": " + *err);
            slot = std::nullopt;
            return;
        }
        values.push_back(std::move(v));
    }
    slot = std::move(values);
}

void Group::parseArgs(Context& ctx, std::vector<std::string> args) const {
    Command::parseArgs(ctx, std::move(args));

    std::vector<std::string> rest = ctx.args();
    if (chain_) {
        ctx.setProtectedArgs(std::move(rest));
        ctx.setArgs({});
    } else if (!rest.empty()) {
        ctx.setProtectedArgs({rest.front()});
        ctx.setArgs(std::vector<std::string>(rest.begin() + 1, rest.end()));
    }
}

Group& Group::addCommand(std::unique_ptr<Command> cmd) {
    if (!cmd) throw std::invalid_argument("group " + name() + ": cannot add a null command");
    if (cmd->name().empty()) throw std::invalid_argument("group " + name() + ": subcommand needs a name");
    auto key = cmd->name();
    commands_[std::move(key)] = std::move(cmd);
    return *this;
}

std::vector<std::string> Group::listCommands(const Context&) const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& [n, _] : commands_) names.push_back(n);
    return names;
}

const Command* Group::getCommand(const Context&, const std::string& name) const {
    const auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : it->second.get();
}

Group::Resolution Group::resolveCommand(const Context& ctx, const std::vector<std::string>& args) const {
    Resolution res;
    if (args.empty()) return res;

    res.name = args.front();
    res.command = getCommand(ctx, res.name);
    if (!res.command) {
        if (const auto* normalize = ctx.tokenNormalizeFunc()) {
            res.name = (*normalize)(res.name);
            res.command = getCommand(ctx, res.name);
        }
    }
    if (!res.command && !ctx.resilientParsing()) {
        std::string msg = "No such command '" + args.front() + "'.";
        const auto hints = utils::suggest(args.front(), listCommands(ctx));
        if (!hints.empty()) msg += " Did you mean '" + hints.front() + "'?";
        throw UsageError(msg);
    }
    res.remaining.assign(args.begin() + 1, args.end());
    return res;
}

} // namespace shellac
