#include "../base_cli.hpp"
#include "../theme.hpp"
#include <core/time_utils.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_status(const LockStatus& status) {
    if (!status.exists) {
        std::cout << theme::ok("No sync in progress");
        return;
    }

    std::string state = lock_state_name(status.state);
    if (status.state == LockState::Active) {
        std::cout << theme::info("Sync in progress");
    } else {
        std::cout << theme::fail(fmt::format("Sync lock is {}", state));
    }

    std::cout << theme::kv("State", state);
    std::cout << theme::kv("Phase", phase_name(status.phase));
    std::cout << theme::kv("Heartbeat", format_age(status.age_ms) + " ago");
    if (status.owner) {
        const auto& owner = *status.owner;
        std::cout << theme::kv("Owner", fmt::format("pid {} on {}", owner.pid,
                                                    owner.host.empty() ? "?" : owner.host));
        std::cout << theme::kv("Since", format_clock(owner.acquired_at));
    }
    if (status.progress) {
        const auto& p = *status.progress;
        std::cout << theme::kv("Progress", fmt::format("{}/{} {}", p.current, p.total, p.description));
    }
    if (status.is_stuck) {
        std::cout << theme::step("Run 'tandem lock reclaim' to discard it");
    }
}

static void do_lock(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config()) return;
    if (!cli.lock) {
        cli.fail("Lock manager unavailable");
        return;
    }

    std::string sub = args.empty() ? "status" : args[0];
    if (sub == "status") {
        print_status(cli.lock->check_status());
    } else if (sub == "cleanup") {
        if (cli.lock->cleanup_stale()) {
            std::cout << theme::ok("Removed dead sync lock");
        } else {
            std::cout << theme::info("Nothing to clean up");
        }
    } else if (sub == "reclaim") {
        if (cli.lock->force_reclaim()) {
            std::cout << theme::ok("Sync lock reclaimed");
        } else {
            auto status = cli.lock->check_status();
            if (status.exists) {
                cli.fail("Sync lock is active; it can only be reclaimed when stuck or dead");
            } else {
                std::cout << theme::info("No sync lock to reclaim");
            }
        }
    } else {
        cli.fail("Usage: tandem lock <status|cleanup|reclaim>");
    }
}

void register_lock_commands(BaseCLI& cli) {
    cli.add_command("lock", do_lock, "Sync lock: status, cleanup, reclaim");
}
