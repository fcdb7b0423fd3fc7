#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include "cli/tandem_cli.hpp"
#include "cli/theme.hpp"

namespace fs = std::filesystem;

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    tandem "
              << theme::color::RESET << theme::color::BROWN << "<command> [args] [repo]"
              << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tandem --repo "
              << theme::color::RESET << theme::color::BROWN << "<dir> <command> [args]"
              << theme::color::RESET << "\n";

    TandemCLI cli(fs::current_path());
    cli.print_help();

    std::cout << theme::color::DIM
              << "    tandem --version        Show version\n"
              << "    tandem --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        fs::path repo = fs::current_path();
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "--repo" || arg == "-C") && i + 1 < argc) {
                repo = argv[++i];
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty() || positional[0] == "--help") {
            print_usage();
            return 0;
        }
        if (positional[0] == "--version") {
            std::cout << theme::color::BROWN << theme::color::BOLD << "tandem"
                      << theme::color::RESET << theme::color::DIM
                      << " version 0.1.0" << theme::color::RESET << "\n";
            return 0;
        }

        std::string cmd = positional[0];
        std::vector<std::string> args(positional.begin() + 1, positional.end());

        // A trailing positional past the command's own arguments names the repository
        std::vector<std::string> plain;
        for (const auto& a : args) {
            if (a.rfind("--", 0) != 0) plain.push_back(a);
        }
        int arity = positional_arity(cmd, args);
        if (arity >= 0 && static_cast<int>(plain.size()) == arity + 1) {
            repo = plain.back();
            for (auto it = args.rbegin(); it != args.rend(); ++it) {
                if (*it == plain.back()) {
                    args.erase(std::next(it).base());
                    break;
                }
            }
        }

        TandemCLI cli(fs::absolute(repo));
        return cli.run_command(cmd, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
