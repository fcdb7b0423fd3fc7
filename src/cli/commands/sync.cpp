#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <algorithm>
#include <fmt/format.h>

static bool has_flag(const std::vector<std::string>& args, const std::string& flag) {
    return std::find(args.begin(), args.end(), flag) != args.end();
}

static void print_conflicts(const std::vector<Conflict>& conflicts) {
    std::cout << theme::section("Conflicts");
    for (const auto& c : conflicts) {
        std::string tags;
        if (c.is_new) tags += " new";
        if (c.is_deleted) tags += " deleted";
        if (c.is_lfs) tags += " large-file";
        std::cout << theme::step(c.filepath + (tags.empty() ? "" : theme::dim(" [" + tags.substr(1) + "]")));
    }
    std::cout << "\n" << theme::info("Edit the files, then run 'tandem complete-merge <file>...'");
}

static void print_result(BaseCLI& cli, const SyncResult& result) {
    switch (result.status) {
        case SyncStatus::Synced:
            std::cout << theme::ok(result.message);
            break;
        case SyncStatus::Conflicts:
            print_conflicts(result.conflicts);
            cli.fail(result.message);
            break;
        case SyncStatus::Offline:
            std::cout << theme::info(result.message);
            break;
        case SyncStatus::Skipped:
        case SyncStatus::AlreadyRunning:
            std::cout << theme::info(result.message);
            break;
        case SyncStatus::AuthFailed:
            cli.fail("Authentication failed: " + result.message);
            std::cout << theme::step("Store a token with 'tandem credentials set git_token <token>'");
            break;
        case SyncStatus::Rejected:
            cli.fail("Push rejected: " + result.message);
            break;
        case SyncStatus::Failed:
            cli.fail(result.message);
            break;
    }

    for (const auto& f : result.lfs.failed) {
        std::cout << theme::log(fmt::format("{}: {}", f.path, f.message));
    }
}

static void do_sync(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_repository()) return;

    SyncTrigger trigger = has_flag(args, "--auto") ? SyncTrigger::Automatic : SyncTrigger::Manual;
    auto result = cli.sync->sync_changes(cli.credentials(), cli.author(), trigger,
        [](const std::string& msg) { std::cout << theme::log(msg); });
    print_result(cli, result);
}

static void do_complete_merge(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_repository()) return;
    if (args.empty()) {
        cli.fail("Usage: tandem complete-merge <file>...");
        return;
    }

    auto result = cli.sync->complete_merge(cli.credentials(), cli.author(), args,
        [](const std::string& msg) { std::cout << theme::log(msg); });
    print_result(cli, result);
}

static void do_remote(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_repository()) return;

    auto status = cli.sync->remote_branch_status(cli.credentials());
    switch (status.state) {
        case RemoteBranchState::Found:
            std::cout << theme::ok("Remote branch found");
            std::cout << theme::kv("Commit", status.oid.value_or("").substr(0, 12));
            break;
        case RemoteBranchState::NotFound:
            std::cout << theme::info("Remote branch does not exist yet");
            break;
        case RemoteBranchState::Error:
            cli.fail("Cannot reach remote: " + status.message);
            break;
    }
}

static void do_pack(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_repository()) return;

    bool silent = has_flag(args, "--silent");
    auto result = cli.sync->pack_repository(silent,
        [](const std::string& msg) { std::cout << theme::log(msg); });
    if (result.is_err()) {
        if (!silent) cli.fail(result.error);
        return;
    }
    if (!silent) {
        std::cout << theme::ok(fmt::format("Packed {} objects", result.value.objects_packed));
    }
}

void register_sync_commands(BaseCLI& cli) {
    cli.add_command("sync", do_sync, "Commit, fetch, merge and push [--auto]");
    cli.add_command("complete-merge", do_complete_merge, "Finish a merge after resolving files");
    cli.add_command("remote", do_remote, "Check whether the remote branch exists");
    cli.add_command("pack", do_pack, "Pack loose objects [--silent]");
}
