#include <iostream>
#include <string>
#include <vector>

#include "shellac/shellac.hpp"

// A chained group: `app build test --fast deploy --env prod` runs three steps.
int main(int argc, char** argv) {
    shellac::Group cli("app", "Chained pipeline example");
    cli.chain();

    shellac::Command build("build", "Compile the sources.");
    build.withOption(shellac::Option({"--jobs", "-j"}).setType(shellac::types::integer()).setHelp("Parallel jobs"));

    shellac::Command test("test", "Run the test suite.");
    test.withOption(shellac::Option({"--fast"}).setFlag().setHelp("Skip slow tests"));

    shellac::Command deploy("deploy", "Ship it.");
    deploy.withOption(shellac::Option({"--env"}).setChoices({"staging", "prod"}).setHelp("Target environment"));

    cli.addCommand(std::move(build));
    cli.addCommand(std::move(test));
    cli.addCommand(std::move(deploy));

    if (const auto rc = shellac::completeFromEnvironment(cli, "app", shellac::ShellRegistry::withDefaults())) return *rc;

    try {
        auto root = cli.makeContext("app", std::vector<std::string>(argv + 1, argv + argc));
        std::vector<std::string> remaining = root->protectedArgs();
        while (!remaining.empty()) {
            const auto res = cli.resolveCommand(*root, remaining);
            shellac::ContextOptions step;
            step.allowExtraArgs = true;
            step.allowInterspersedArgs = false;
            auto ctx = res.command->makeContext(res.name, res.remaining, std::move(root), step);
            std::cout << "step: " << ctx->commandPath() << "\n";
            remaining = ctx->args();
            root = ctx->releaseParent();
        }
    } catch (const shellac::UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
