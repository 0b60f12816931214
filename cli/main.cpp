#include "modlint/cli/commands/command.hpp"
#include "modlint/version.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

    void print_usage() {
        std::cout << "modlint " << modlint::VERSION_STRING << "\n\n"
                  << "Usage: modlint <command> [OPTIONS]\n\n"
                  << "Commands:\n";
        for (const auto* cmd : modlint::cli::CommandRegistry::instance().list()) {
            std::string name(cmd->name());
            name.resize(std::max<std::size_t>(name.size() + 1, 12), ' ');
            std::cout << "  " << name << cmd->description() << "\n";
        }
        std::cout << "\nRun 'modlint <command> --help' for command options.\n";
    }

}  // namespace

int main(const int argc, char** argv) {
    using namespace modlint::cli;

    const std::vector<std::string> all(argv + 1, argv + argc);
    if (all.empty() || all[0] == "help" || all[0] == "--help" || all[0] == "-h") {
        print_usage();
        return all.empty() ? 2 : 0;
    }
    if (all[0] == "--version" || all[0] == "version") {
        std::cout << "modlint " << modlint::VERSION_STRING << "\n";
        return 0;
    }

    Command* cmd = CommandRegistry::instance().find(all[0]);
    if (cmd == nullptr) {
        std::cerr << "error: unknown command '" << all[0] << "'\n";
        print_usage();
        return 2;
    }

    try {
        const std::vector<std::string> rest(all.begin() + 1, all.end());
        auto parsed = parse_arguments(rest, cmd->arguments());
        if (!parsed.success) {
            std::cerr << "error: " << parsed.error << "\n";
            return 2;
        }
        if (!parsed.args.get_flag("help")) {
            if (const std::string problem = cmd->validate(parsed.args); !problem.empty()) {
                std::cerr << "error: " << problem << "\n";
                return 2;
            }
        }
        return cmd->execute(parsed.args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 2;
    }
}
