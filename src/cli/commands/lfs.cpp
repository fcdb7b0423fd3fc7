#include "../base_cli.hpp"
#include "../theme.hpp"
#include <lfs/gitattributes.hpp>
#include <iostream>
#include <fmt/format.h>

static std::string human_size(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", value, units[unit]);
}

static void do_lfs_status(BaseCLI& cli) {
    auto status = cli.lfs->lfs_status();

    std::cout << theme::section("Large files");
    std::cout << theme::kv("Pointers", std::to_string(status.pointer_files));
    std::cout << theme::kv("Size", human_size(status.total_size));
    std::cout << theme::kv("Missing", std::to_string(status.missing_payloads));
    std::cout << theme::kv("Pending", std::to_string(status.pending_uploads));
    std::cout << theme::kv("Strategy", media_strategy_name(cli.config->lfs().media_strategy));

    if (!status.tracked_patterns.empty()) {
        std::cout << theme::section("Tracked patterns");
        for (const auto& p : status.tracked_patterns) std::cout << theme::step(p);
    }
    std::cout << "\n";
}

static void do_lfs(BaseCLI& cli, const std::vector<std::string>& args) {
    std::string sub = args.empty() ? "status" : args[0];

    if (sub == "track") {
        if (args.size() < 2) {
            cli.fail("Usage: tandem lfs track <pattern>");
            return;
        }
        LfsAttributes attributes(cli.repo_dir);
        auto r = attributes.track_pattern(args[1]);
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << theme::ok("Tracking " + args[1]);
        return;
    }

    if (!cli.require_repository()) return;

    if (sub == "status") {
        do_lfs_status(cli);
    } else if (sub == "fetch") {
        if (args.size() < 2) {
            cli.fail("Usage: tandem lfs fetch <pointer-path>");
            return;
        }
        auto r = cli.lfs->fetch_payload(args[1]);
        if (r.is_err()) {
            cli.fail(r.error);
            return;
        }
        std::cout << theme::ok("Fetched to " + r.value.string());
    } else {
        cli.fail("Usage: tandem lfs <status|fetch|track>");
    }
}

void register_lfs_commands(BaseCLI& cli) {
    cli.add_command("lfs", do_lfs, "Large files: status, fetch <pointer>, track <pattern>");
}
