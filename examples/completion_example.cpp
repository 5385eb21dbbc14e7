#include <iostream>
#include <string>
#include <vector>

#include "shellac/shellac.hpp"

// Activate with:
//   eval "$(_APP_COMPLETE=source_bash ./completion_example)"
// and name the binary "app" (or pass it as progName below).
int main(int argc, char** argv) {
    shellac::Group cli("app", "Completion example");
    cli.withOption(shellac::Option({"--verbose", "-v"}).setFlag().setHelp("Enable verbose output"));

    shellac::Command printCmd("print", "Prints a message.");
    printCmd.withOption(shellac::Option({"--message", "-m"}).setHelp("Message to print").setDefault({"hi"}));
    printCmd.withOption(shellac::Option({"--style"}).setChoices({"plain", "loud"}).setHelp("Output style"));

    cli.addCommand(std::move(printCmd));

    if (const auto rc = shellac::completeFromEnvironment(cli, "app", shellac::ShellRegistry::withDefaults())) return *rc;

    const std::vector<std::string> args(argv + 1, argv + argc);
    try {
        auto ctx = cli.makeContext("app", args);
        const auto res = cli.resolveCommand(*ctx, ctx->protectedArgs());
        if (!res.command) {
            std::cout << "commands:";
            for (const auto& name : cli.listCommands(*ctx)) std::cout << " " << name;
            std::cout << "\n";
            return 0;
        }
        std::vector<std::string> rest = res.remaining;
        rest.insert(rest.end(), ctx->args().begin(), ctx->args().end());
        const auto sub = res.command->makeContext(res.name, rest, std::move(ctx));
        std::cout << sub->value<std::string>("message").value_or("") << "\n";
    } catch (const shellac::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
