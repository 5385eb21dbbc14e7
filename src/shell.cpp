#include "shellac/shell.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <system_error>

#include "shellac/completion.hpp"
#include "shellac/utils.hpp"

namespace {

// Only bash 4.4 and later understand `complete -o nosort`.
const char* const kBashScript = R"SHELLAC(
{complete_func}() {
    local IFS=$'\n'
    local response

    response=$(env COMP_WORDS="${COMP_WORDS[*]}" \
                   COMP_CWORD=$COMP_CWORD \
                   {autocomplete_var}=complete $1)

    for completion in $response; do
        IFS=',' read type value <<< "$completion"

        if [[ $type == 'dir' ]]; then
            COMPREPLY=()
            compopt -o dirnames
        elif [[ $type == 'file' ]]; then
            COMPREPLY=()
            compopt -o default
        elif [[ $type == 'none' ]]; then
            COMPREPLY+=($value)
        fi
    done

    return 0
}

{complete_func}_setup() {
    complete -o nosort -F {complete_func} {script_names}
}

{complete_func}_setup
)SHELLAC";

const char* const kZshScript = R"SHELLAC(
#compdef {script_names}

{complete_func}() {
    local -a completions
    local -a completions_with_descriptions
    local -a response
    (( ! $+commands[{script_names}] )) && return 1

    response=("${(@f)$(env COMP_WORDS="${words[*]}" \
                          COMP_CWORD=$((CURRENT-1)) \
                          {autocomplete_var}="complete_zsh" \
                          {script_names})}")

    for key descr in ${(kv)response}; do
        if [[ "$descr" == "_" ]]; then
            completions+=("$key")
        else
            completions_with_descriptions+=("$key":"$descr")
        fi
    done

    if [ -n "$completions_with_descriptions" ]; then
        _describe -V unsorted completions_with_descriptions -U
    fi

    if [ -n "$completions" ]; then
        compadd -U -V unsorted -a completions
    fi
    compstate[insert]="automenu"
}

compdef {complete_func} {script_names}
)SHELLAC";

const char* const kFishScript = R"SHELLAC(
function {complete_func}_complete;
    set -l response;

    for value in (env {autocomplete_var}=complete_fish \
            COMP_WORDS=(commandline -cp) COMP_CWORD=(commandline -t) \
            {script_names});
        set response $response $value;
    end;

    for completion in $response;
        set -l metadata (string split "," $completion);

        if test $metadata[1] = "dir";
            __fish_complete_directories $metadata[2];
        else if test $metadata[1] = "file";
            __fish_complete_path $metadata[2];
        else if test $metadata[1] = "none";
            echo $metadata[2];
        end;
    end;
end;

complete --no-files --command {script_names} --arguments "({complete_func}_complete)"
)SHELLAC";

struct PipeCloser {
    void operator()(FILE* f) const {
        if (f) pclose(f);
    }
};

// First "d.d.d" run in `text`.
static std::optional<std::pair<int, int>> findVersion(std::string_view text) {
    auto digit = [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; };
    for (std::size_t i = 0; i + 5 <= text.size(); ++i) {
        if (digit(text[i]) && text[i + 1] == '.' && digit(text[i + 2]) && text[i + 3] == '.' && digit(text[i + 4])) {
            return std::make_pair(text[i] - '0', text[i + 2] - '0');
        }
    }
    return std::nullopt;
}

} // namespace

namespace shellac {

std::optional<std::string> ShellIo::env(const std::string& name) const {
    if (env_) return env_(name);
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

std::string ShellComplete::source() const { throw NotImplementedError("source function needs to be overridden"); }

bool ShellComplete::complete() const { throw NotImplementedError("complete function needs to be overridden"); }

std::string ShellComplete::requireEnv(const std::string& name) const {
    auto v = io_.env(name);
    if (!v) throw ShellCompletionError(name + " is not set");
    return std::move(*v);
}

ShellComplete::CompletionRequest ShellComplete::cursorRequest() const {
    const auto words = utils::splitArgString(requireEnv("COMP_WORDS"));
    const auto cwordText = requireEnv("COMP_CWORD");

    long long cword = 0;
    const auto trimmed = utils::trim(cwordText);
    const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), cword);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size() || cword < 0) {
        throw ShellCompletionError("invalid COMP_CWORD: " + cwordText);
    }

    CompletionRequest req;
    const auto end = std::min<std::size_t>(static_cast<std::size_t>(cword), words.size());
    if (end > 1) req.args.assign(words.begin() + 1, words.begin() + static_cast<std::ptrdiff_t>(end));
    if (static_cast<std::size_t>(cword) < words.size()) req.incomplete = words[static_cast<std::size_t>(cword)];
    return req;
}

std::vector<Candidate> ShellComplete::run(const CompletionRequest& req) const {
    return shellac::complete(*cli_, progName_, req.args, req.incomplete);
}

BashComplete::BashComplete(const Command& cli, std::string progName, std::string completeVar, ShellIo io, VersionProbe probe)
    : ShellComplete(cli, std::move(progName), std::move(completeVar), std::move(io)),
      probe_(probe ? std::move(probe) : VersionProbe(&probeBashVersion)) {}

std::string BashComplete::source() const {
    if (bashVersionNotUsable(probe_)) {
        throw UnsupportedShellError("Shell completion is not supported for bash versions older than 4.4");
    }
    return kBashScript;
}

bool BashComplete::complete() const {
    auto& os = io().out();
    for (const auto& c : run(cursorRequest())) os << "none," << c.value << "\n";
    return true;
}

std::string ZshComplete::source() const { return kZshScript; }

bool ZshComplete::complete() const {
    auto& os = io().out();
    for (const auto& c : run(cursorRequest())) {
        os << c.value << "\n";
        os << (c.description && !c.description->empty() ? *c.description : "_") << "\n";
    }
    return true;
}

std::string FishComplete::source() const { return kFishScript; }

bool FishComplete::complete() const {
    CompletionRequest req;
    const auto words = utils::splitArgString(requireEnv("COMP_WORDS"));
    req.incomplete = requireEnv("COMP_CWORD");
    if (words.size() > 1) req.args.assign(words.begin() + 1, words.end());
    // A partially typed word shows up in both variables.
    if (!req.incomplete.empty() && !req.args.empty() && req.args.back() == req.incomplete) req.args.pop_back();

    auto& os = io().out();
    for (const auto& c : run(req)) {
        os << "none," << c.value;
        if (c.description && !c.description->empty()) os << "\t" << *c.description;
        os << "\n";
    }
    return true;
}

std::optional<std::string> probeBashVersion() {
    std::unique_ptr<FILE, PipeCloser> pipe(popen("bash --version 2>/dev/null", "r"));
    if (!pipe) return std::nullopt;

    std::string output;
    char buf[256];
    while (std::fgets(buf, sizeof(buf), pipe.get())) output += buf;
    return output;
}

bool bashVersionNotUsable(const BashComplete::VersionProbe& probe) {
    if (!probe) return false;
    const auto output = probe();
    if (!output) return false;
    const auto version = findVersion(*output);
    if (!version) return false;
    const auto [major, minor] = *version;
    return major < 4 || (major == 4 && minor < 4);
}

ShellRegistry ShellRegistry::withDefaults() {
    ShellRegistry r;
    r.add<BashComplete>("bash");
    r.add<ZshComplete>("zsh");
    r.add<FishComplete>("fish");
    return r;
}

ShellRegistry& ShellRegistry::add(std::string name, Factory factory) {
    if (name.empty()) throw std::invalid_argument("shell name must not be empty");
    if (!factory) throw std::invalid_argument("shell '" + name + "': completion factory must not be empty");
    factories_[std::move(name)] = std::move(factory);
    return *this;
}

std::vector<std::string> ShellRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, _] : factories_) out.push_back(name);
    return out;
}

std::unique_ptr<ShellComplete> ShellRegistry::create(const std::string& name,
                                                     const Command& cli,
                                                     std::string progName,
                                                     std::string completeVar,
                                                     ShellIo io) const {
    const auto it = factories_.find(name);
    if (it == factories_.end()) return std::make_unique<ShellComplete>(cli, std::move(progName), std::move(completeVar), std::move(io));

    auto adapter = it->second(cli, std::move(progName), std::move(completeVar), std::move(io));
    if (!adapter) throw std::invalid_argument("shell '" + name + "': completion factory returned no adapter");
    return adapter;
}

std::string completionFunctionName(std::string_view progName) { return "_" + utils::sanitizeIdentifier(progName) + "_completion"; }

std::string defaultCompleteVar(std::string_view progName) {
    std::string var = "_";
    for (const unsigned char ch : progName) {
        var.push_back(ch == '-' ? '_' : static_cast<char>(std::toupper(ch)));
    }
    return var + "_COMPLETE";
}

std::string getCompletionScript(const Command& cli,
                                const std::string& progName,
                                const std::string& completeVar,
                                const std::string& shell,
                                const ShellRegistry& registry,
                                const ShellIo& io) {
    const auto adapter = registry.create(shell, cli, progName, completeVar, io);

    auto script = adapter->source();
    script = utils::replaceAll(std::move(script), "{complete_func}", completionFunctionName(progName));
    script = utils::replaceAll(std::move(script), "{script_names}", progName);
    script = utils::replaceAll(std::move(script), "{autocomplete_var}", completeVar);
    return std::string(utils::trim(script)) + ";";
}

bool shellComplete(const Command& cli,
                   const std::string& progName,
                   const std::string& completeVar,
                   const std::string& instruction,
                   const ShellRegistry& registry,
                   const ShellIo& io) {
    std::string command = instruction;
    std::string shell = "bash";
    if (const auto pos = instruction.find('_'); pos != std::string::npos) {
        command = instruction.substr(0, pos);
        shell = instruction.substr(pos + 1);
    }

    try {
        if (command == "source") {
            io.out() << getCompletionScript(cli, progName, completeVar, shell, registry, io) << "\n";
            return true;
        }
        if (command == "complete") return registry.create(shell, cli, progName, completeVar, io)->complete();
    } catch (const ShellCompletionError& e) {
        io.err() << "Error: " << e.what() << "\n";
        return false;
    }
    return false;
}

std::optional<int> completeFromEnvironment(const Command& cli,
                                           const std::string& progName,
                                           const ShellRegistry& registry,
                                           const ShellIo& io) {
    const auto completeVar = defaultCompleteVar(progName);
    const auto instruction = io.env(completeVar);
    if (!instruction || instruction->empty()) return std::nullopt;
    return shellComplete(cli, progName, completeVar, *instruction, registry, io) ? 0 : 1;
}

} // namespace shellac
