#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/config.hpp>
#include <iostream>

// Create the repository (if needed), point it at a remote, keep payloads
// out of commits and write the global config on first use.
static void do_init(BaseCLI& cli, const std::vector<std::string>& args) {
    auto created = create_default_global_config();
    if (created.is_err()) {
        cli.fail(created.error);
        return;
    }
    if (!cli.require_config()) return;

    Libgit2Backend git(cli.repo_dir);
    if (!git.is_open()) {
        git.init("main");
        std::cout << theme::ok("Initialized repository in " + cli.repo_dir.string());
    }

    const std::string& remote = cli.config->sync().remote;
    if (!args.empty()) {
        if (git.remote_url(remote)) {
            std::cout << theme::info("Remote '" + remote + "' already configured");
        } else {
            git.add_remote(remote, args[0]);
            std::cout << theme::ok("Added remote '" + remote + "'");
        }
    }

    cli.init_managers();
    if (cli.lfs) {
        auto ignored = cli.lfs->ensure_payloads_ignored();
        if (ignored.is_err()) {
            cli.fail(ignored.error);
            return;
        }
        if (ignored.value) std::cout << theme::ok("Ignoring " + cli.config->lfs().payload_prefix);
    }
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Create the repository [remote-url]");
}
