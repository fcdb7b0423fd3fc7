#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>

static void do_metadata(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config()) return;
    if (!cli.metadata) {
        cli.fail("Metadata manager unavailable");
        return;
    }

    std::string sub = args.empty() ? "get" : args[0];
    if (sub == "get") {
        auto doc = cli.metadata->read();
        if (doc.is_err()) {
            cli.fail(doc.error);
            return;
        }
        std::cout << doc.value.dump(2) << "\n";
    } else if (sub == "set-version") {
        if (args.size() < 3) {
            cli.fail("Usage: tandem metadata set-version <key> <version>");
            return;
        }
        auto r = cli.metadata->update_required_versions({{args[1], args[2]}});
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << theme::ok(args[1] + " requires " + args[2]);
    } else if (sub == "versions") {
        auto versions = cli.metadata->required_versions();
        if (versions.is_err()) {
            cli.fail(versions.error);
            return;
        }
        for (const auto& [key, version] : versions.value) {
            std::cout << theme::kv(key, version);
        }
    } else {
        cli.fail("Usage: tandem metadata <get|set-version|versions>");
    }
}

void register_metadata_commands(BaseCLI& cli) {
    cli.add_command("metadata", do_metadata, "metadata.json: get, set-version <key> <version>, versions");
}
