#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "shellac/shellac.hpp"

static std::vector<shellac::Suggestion> colors(const shellac::Context&, const std::vector<std::string>&, std::string_view incomplete) {
    std::vector<shellac::Suggestion> out;
    for (const auto* c : {"red", "green", "blue"}) {
        if (shellac::utils::startsWith(c, incomplete)) out.emplace_back(shellac::Candidate{c, std::string("the color ") + c});
    }
    return out;
}

int main(int argc, char** argv) {
    shellac::Group cli("app", "Dynamic completion example");

    shellac::Command fruitCmd("fruit", "Fruit command.");
    fruitCmd.withArgument(shellac::Argument("names").setNargs(shellac::Argument::kUnbounded).setChoices({"apple", "banana", "cherry"}));

    shellac::Command paintCmd("paint", "Paint command.");
    paintCmd.withOption(shellac::Option({"--color", "-c"}).setHelp("Color to use").setCompletion(colors));
    paintCmd.withArgument(shellac::Argument("surface").setCompletion(
        [](const shellac::Context& ctx, const std::vector<std::string>&, std::string_view) {
            // Offer surfaces that suit the color picked so far.
            const auto color = ctx.value<std::string>("color").value_or("");
            if (color == "red") return std::vector<shellac::Suggestion>{std::string("barn"), std::string("door")};
            return std::vector<shellac::Suggestion>{std::string("wall"), std::string("fence")};
        }));

    cli.addCommand(std::move(fruitCmd));
    cli.addCommand(std::move(paintCmd));

    if (const auto rc = shellac::completeFromEnvironment(cli, "app", shellac::ShellRegistry::withDefaults())) return *rc;

    // Without a completion request, show what a shell would see for the given words.
    const std::vector<std::string> args(argv + 1, argv + argc);
    const std::string incomplete = args.empty() ? std::string() : args.back();
    const std::vector<std::string> done = args.empty() ? args : std::vector<std::string>(args.begin(), args.end() - 1);
    for (const auto& c : shellac::complete(cli, "app", done, incomplete)) {
        std::cout << c.value;
        if (c.description) std::cout << "\t" << *c.description;
        std::cout << "\n";
    }
    return 0;
}
