#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/credentials.hpp>
#include <iostream>

static void do_credentials(BaseCLI& cli, const std::vector<std::string>& args) {
    auto& creds = CredentialManager::instance();
    std::string sub = args.empty() ? "list" : args[0];

    if (sub == "list") {
        auto entries = creds.list();
        if (entries.empty()) {
            std::cout << theme::info("No stored credentials");
            return;
        }
        for (const auto& info : entries) {
            std::cout << theme::kv(info.key, info.has_value ? "(set)" : "(empty)");
        }
    } else if (sub == "set") {
        if (args.size() < 3) {
            cli.fail("Usage: tandem credentials set <key> <value>");
            return;
        }
        auto r = creds.set(args[1], args[2]);
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << theme::ok("Stored " + args[1]);
    } else if (sub == "get") {
        if (args.size() < 2) {
            cli.fail("Usage: tandem credentials get <key>");
            return;
        }
        auto r = creds.get(args[1]);
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << r.value << "\n";
    } else if (sub == "remove") {
        if (args.size() < 2) {
            cli.fail("Usage: tandem credentials remove <key>");
            return;
        }
        auto r = creds.remove(args[1]);
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << theme::ok("Removed " + args[1]);
    } else {
        cli.fail("Usage: tandem credentials <list|set|get|remove>");
    }
}

void register_credentials_commands(BaseCLI& cli) {
    cli.add_command("credentials", do_credentials, "Stored git credentials: list, set, get, remove");
}
