#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#include "shellac/shellac.hpp"

static std::string underscoreToDash(std::string token) {
    std::replace(token.begin(), token.end(), '_', '-');
    return token;
}

int main(int argc, char** argv) {
    shellac::Command cli("app", "Normalize example");
    cli.normalizeTokens(underscoreToDash);
    cli.helpOptionNames({"-h", "--help"});

    cli.withOption(shellac::Option({"--message-text"}).setHelp("Message").setDefault({"default"}));
    cli.withOption(shellac::Option({"--do-thing"}).setFlag().setHelp("Do thing"));
    cli.withOption(shellac::Option({"--secret"}).setHidden());

    if (const auto rc = shellac::completeFromEnvironment(cli, "app", shellac::ShellRegistry::withDefaults())) return *rc;

    try {
        const auto ctx = cli.makeContext("app", std::vector<std::string>(argv + 1, argv + argc));
        std::cout << "message=" << ctx->value<std::string>("message_text").value_or("") << "\n";
        std::cout << "doThingSeen=" << (ctx->value<bool>("do_thing").value_or(false) ? "true" : "false") << "\n";
    } catch (const shellac::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
