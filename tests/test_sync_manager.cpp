#include <gtest/gtest.h>
#include <managers/sync_manager.hpp>
#include <platform/file_ops.hpp>
#include "fakes/fake_git.hpp"
#include "fakes/fake_lfs_server.hpp"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

static const std::string POINTERS = ".project/attachments/pointers";
static const std::string FILES = ".project/attachments/files";

// One working copy with its own lock, sync engine and (optionally) LFS stack
struct Clone {
    fs::path dir;
    NonFatalSink sink;
    Config config;
    std::unique_ptr<FakeGit> git;
    std::unique_ptr<SyncLockManager> lock;
    std::unique_ptr<LfsClient> lfs_client;
    std::unique_ptr<LfsReconciler> lfs;
    std::unique_ptr<SyncManager> sync;
    AuthorIdentity author;
    bool online = true;
    std::vector<int> sleeps;
    std::vector<std::string> messages;

    SyncResult run(SyncTrigger trigger = SyncTrigger::Manual) {
        return sync->sync_changes(GitCredentials{"user", "token"}, author, trigger,
                                  [this](const std::string& m) { messages.push_back(m); });
    }

    SyncResult finish(const std::vector<std::string>& resolved) {
        return sync->complete_merge(GitCredentials{"user", "token"}, author, resolved,
                                    [this](const std::string& m) { messages.push_back(m); });
    }
};

class SyncManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<FakeRemote> remote;
    FakeLfsServer lfs_server;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("tandem_sync_manager_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
        remote = std::make_shared<FakeRemote>();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::unique_ptr<Clone> make_clone(const std::string& name, bool with_lfs = false) {
        auto c = std::make_unique<Clone>();
        c->dir = test_dir / name;
        c->git = std::make_unique<FakeGit>(c->dir, remote);

        auto loaded = Config::load(c->dir, test_dir / "global.yaml");
        EXPECT_TRUE(loaded.is_ok()) << loaded.error;
        c->config = loaded.value;

        c->lock = std::make_unique<SyncLockManager>(c->dir, c->config.lock(), c->sink, name);
        if (with_lfs) {
            RetryPolicy retry;
            retry.sleep = [](int) {};
            c->lfs_client = std::make_unique<LfsClient>(
                lfs_server, [](TransferDirection) { return LfsEndpoint{FakeLfsServer::BASE, {}}; },
                retry);
            c->lfs = std::make_unique<LfsReconciler>(c->dir, c->config.lfs(), *c->lfs_client, c->sink);
        }
        c->sync = std::make_unique<SyncManager>(*c->git, *c->lock, c->config, c->lfs.get());

        Clone* raw = c.get();
        c->sync->set_connectivity_probe([raw](const std::string&, int) { return raw->online; });
        c->sync->set_sleep([raw](int ms) { raw->sleeps.push_back(ms); });
        c->author = AuthorIdentity{name, name + "@example.com"};
        return c;
    }

    // Alice publishes `files`, Bob checks them out
    std::pair<std::unique_ptr<Clone>, std::unique_ptr<Clone>>
    shared_history(const std::map<std::string, std::string>& files) {
        auto alice = make_clone("alice");
        auto bob = make_clone("bob");
        for (const auto& [path, content] : files) alice->git->write(path, content);
        EXPECT_EQ(alice->run().status, SyncStatus::Synced);
        EXPECT_EQ(bob->run().status, SyncStatus::Synced);
        return {std::move(alice), std::move(bob)};
    }

    std::string remote_head() const {
        auto it = remote->branches.find("main");
        return it == remote->branches.end() ? "" : it->second;
    }

    const FakeCommit& remote_commit() const { return remote->objects.at(remote_head()); }
};

// ── Basic flow ──────────────────────────────────────────────

TEST_F(SyncManagerTest, FirstSyncPublishes) {
    auto alice = make_clone("alice");
    alice->git->write("notes.txt", "hello");

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_TRUE(result.ok());
    ASSERT_TRUE(result.pushed_commit.has_value());
    EXPECT_EQ(*result.pushed_commit, remote_head());
    EXPECT_EQ(remote_commit().files.at("notes.txt"), "hello");
    EXPECT_EQ(remote_commit().message, "Local changes");
    EXPECT_EQ(remote_commit().author.name, "alice");
    EXPECT_FALSE(fs::exists(alice->lock->lock_path()));
    EXPECT_FALSE(alice->lock->held());
}

TEST_F(SyncManagerTest, NothingToDo) {
    auto alice = make_clone("alice");
    alice->git->write("notes.txt", "hello");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    int pushes = alice->git->push_calls;

    auto result = alice->run();
    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_EQ(alice->git->push_calls, pushes);
    EXPECT_FALSE(result.pushed_commit.has_value());
}

TEST_F(SyncManagerTest, FastForward) {
    auto [alice, bob] = shared_history({{"a.txt", "one"}});
    EXPECT_EQ(bob->git->read("a.txt"), "one");
    EXPECT_EQ(bob->git->push_calls, 0);

    alice->git->write("a.txt", "two");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);

    auto result = bob->run();
    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_EQ(bob->git->read("a.txt"), "two");
    EXPECT_EQ(bob->git->head(), remote_head());
    EXPECT_EQ(bob->git->push_calls, 0);
}

TEST_F(SyncManagerTest, CleanMerge) {
    auto [alice, bob] = shared_history({{"a.txt", "a0"}, {"b.txt", "b0"}});

    alice->git->write("a.txt", "a1");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    std::string alice_commit = remote_head();

    bob->git->write("b.txt", "b1");
    auto result = bob->run();

    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_FALSE(result.had_conflicts);
    EXPECT_EQ(bob->git->read("a.txt"), "a1");
    EXPECT_EQ(bob->git->read("b.txt"), "b1");

    const auto& merged = remote_commit();
    EXPECT_EQ(merged.message, "Merge branch 'origin/main' into main");
    ASSERT_EQ(merged.parents.size(), 2u);
    EXPECT_EQ(merged.parents[1], alice_commit);
    EXPECT_EQ(merged.files.at("a.txt"), "a1");
    EXPECT_EQ(merged.files.at("b.txt"), "b1");
}

TEST_F(SyncManagerTest, ConflictingEditsStopBeforePush) {
    auto [alice, bob] = shared_history({{"local1.txt", "l1"}, {"local2.txt", "l2"}});

    alice->git->write("local1.txt", "remote1");
    alice->git->write("local2.txt", "remote2");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    std::string alice_commit = remote_head();

    bob->git->write("local1.txt", "local edit 1");
    bob->git->write("local2.txt", "local edit 2");
    auto result = bob->run();

    EXPECT_EQ(result.status, SyncStatus::Conflicts);
    EXPECT_TRUE(result.had_conflicts);
    ASSERT_EQ(result.conflicts.size(), 2u);
    EXPECT_EQ(result.conflicts[0].filepath, "local1.txt");
    EXPECT_EQ(result.conflicts[0].ours, "local edit 1");
    EXPECT_EQ(result.conflicts[0].theirs, "remote1");
    EXPECT_EQ(result.conflicts[1].filepath, "local2.txt");

    // Nothing pushed, work tree untouched, lock released
    EXPECT_EQ(remote_head(), alice_commit);
    EXPECT_EQ(bob->git->read("local1.txt"), "local edit 1");
    EXPECT_FALSE(fs::exists(bob->lock->lock_path()));
}

TEST_F(SyncManagerTest, CompleteMergeAfterConflicts) {
    auto [alice, bob] = shared_history({{"doc.txt", "base"}, {"other.txt", "o0"}});

    alice->git->write("doc.txt", "alice");
    alice->git->write("other.txt", "o1");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    std::string alice_commit = remote_head();

    bob->git->write("doc.txt", "bob");
    ASSERT_EQ(bob->run().status, SyncStatus::Conflicts);

    bob->git->write("doc.txt", "alice and bob");
    auto result = bob->finish({"doc.txt"});

    EXPECT_EQ(result.status, SyncStatus::Synced);
    const auto& merged = remote_commit();
    EXPECT_EQ(merged.message, "Merge branch 'origin/main'");
    ASSERT_EQ(merged.parents.size(), 2u);
    EXPECT_EQ(merged.parents[1], alice_commit);
    EXPECT_EQ(merged.files.at("doc.txt"), "alice and bob");
    EXPECT_EQ(merged.files.at("other.txt"), "o1");
    EXPECT_EQ(bob->git->read("other.txt"), "o1");
    EXPECT_FALSE(fs::exists(bob->lock->lock_path()));
}

TEST_F(SyncManagerTest, CompleteMergeResolvingToDeletion) {
    auto [alice, bob] = shared_history({{"doc.txt", "base"}});

    alice->git->write("doc.txt", "alice");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);

    bob->git->write("doc.txt", "bob");
    ASSERT_EQ(bob->run().status, SyncStatus::Conflicts);

    bob->git->erase("doc.txt");
    auto result = bob->finish({"doc.txt"});

    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_EQ(remote_commit().files.count("doc.txt"), 0u);
}

TEST_F(SyncManagerTest, CompleteMergeWithUnresolvedFiles) {
    auto [alice, bob] = shared_history({{"x.txt", "x"}, {"y.txt", "y"}});

    alice->git->write("x.txt", "ax");
    alice->git->write("y.txt", "ay");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    std::string alice_commit = remote_head();

    bob->git->write("x.txt", "bx");
    bob->git->write("y.txt", "by");
    ASSERT_EQ(bob->run().status, SyncStatus::Conflicts);

    auto result = bob->finish({"x.txt"});
    EXPECT_EQ(result.status, SyncStatus::Conflicts);
    ASSERT_EQ(result.conflicts.size(), 1u);
    EXPECT_EQ(result.conflicts[0].filepath, "y.txt");
    EXPECT_EQ(remote_head(), alice_commit);
}

TEST_F(SyncManagerTest, CompleteMergeFallsBackToSingleParent) {
    auto [alice, bob] = shared_history({{"doc.txt", "base"}});

    alice->git->write("doc.txt", "alice");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);

    bob->git->write("doc.txt", "bob");
    ASSERT_EQ(bob->run().status, SyncStatus::Conflicts);
    std::string bob_local = bob->git->head();

    bob->git->commit_failures.push(GitErrorKind::Other);
    bob->git->write("doc.txt", "resolved");
    auto result = bob->finish({"doc.txt"});

    const auto& fallback = bob->git->commit_at(bob->git->head());
    EXPECT_EQ(fallback.message, "Resolved conflicts with origin/main");
    ASSERT_EQ(fallback.parents.size(), 1u);
    EXPECT_EQ(fallback.parents[0], bob_local);
    EXPECT_EQ(fallback.files.at("doc.txt"), "resolved");

    // Without the remote parent the push is not a fast-forward
    EXPECT_EQ(result.status, SyncStatus::Rejected);
}

// ── Failure paths ───────────────────────────────────────────

TEST_F(SyncManagerTest, OfflineKeepsLocalCommit) {
    auto alice = make_clone("alice");
    alice->online = false;
    alice->git->write("draft.txt", "offline work");

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::Offline);
    EXPECT_TRUE(result.offline);
    EXPECT_EQ(alice->git->fetch_calls, 0);
    ASSERT_FALSE(alice->git->head().empty());
    EXPECT_EQ(alice->git->commit_at(alice->git->head()).files.at("draft.txt"), "offline work");
    EXPECT_TRUE(remote_head().empty());
    EXPECT_FALSE(fs::exists(alice->lock->lock_path()));

    alice->online = true;
    EXPECT_EQ(alice->run().status, SyncStatus::Synced);
    EXPECT_EQ(remote_commit().files.at("draft.txt"), "offline work");
}

TEST_F(SyncManagerTest, LockHeldElsewhere) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");

    NonFatalSink other_sink;
    SyncLockManager other(alice->dir, alice->config.lock(), other_sink, "other-window");
    ASSERT_TRUE(other.acquire());

    auto manual = alice->run(SyncTrigger::Manual);
    EXPECT_EQ(manual.status, SyncStatus::AlreadyRunning);
    EXPECT_EQ(manual.message, "sync already in progress");

    auto automatic = alice->run(SyncTrigger::Automatic);
    EXPECT_EQ(automatic.status, SyncStatus::Skipped);

    // Nothing was committed and the other holder keeps its lock
    EXPECT_TRUE(alice->git->head().empty());
    EXPECT_TRUE(other.held());
    EXPECT_TRUE(fs::exists(other.lock_path()));

    other.release();
    EXPECT_EQ(alice->run().status, SyncStatus::Synced);
}

TEST_F(SyncManagerTest, PushRetriesNetworkErrors) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");
    alice->git->push_failures.push(GitErrorKind::Network);
    alice->git->push_failures.push(GitErrorKind::Network);

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::Synced);
    EXPECT_EQ(alice->git->push_calls, 3);
    EXPECT_EQ(alice->sleeps, (std::vector<int>{1000, 2000}));
    EXPECT_EQ(remote_commit().files.at("a.txt"), "a");
}

TEST_F(SyncManagerTest, PushRetriesExhausted) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");
    for (int i = 0; i < 3; ++i) alice->git->push_failures.push(GitErrorKind::Network);

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::Offline);
    EXPECT_TRUE(result.offline);
    EXPECT_EQ(alice->git->push_calls, 3);
    EXPECT_EQ(alice->sleeps.size(), 2u);
    EXPECT_TRUE(remote_head().empty());
    EXPECT_FALSE(fs::exists(alice->lock->lock_path()));
}

TEST_F(SyncManagerTest, AuthFailure) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");
    alice->git->fetch_failures.push(GitErrorKind::Auth);

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::AuthFailed);
    EXPECT_FALSE(result.offline);
    EXPECT_EQ(alice->git->push_calls, 0);
}

TEST_F(SyncManagerTest, RejectedPushIsNotRetried) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");
    alice->git->push_failures.push(GitErrorKind::Rejected);

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::Rejected);
    EXPECT_EQ(alice->git->push_calls, 1);
    EXPECT_TRUE(alice->sleeps.empty());
}

TEST_F(SyncManagerTest, FetchNetworkErrorIsOffline) {
    auto alice = make_clone("alice");
    alice->git->fetch_failures.push(GitErrorKind::Network);

    auto result = alice->run();
    EXPECT_EQ(result.status, SyncStatus::Offline);
    EXPECT_TRUE(result.offline);
}

// ── Maintenance ─────────────────────────────────────────────

TEST_F(SyncManagerTest, PackRepository) {
    auto alice = make_clone("alice");
    alice->git->write("a.txt", "a");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);

    std::vector<std::string> messages;
    auto packed = alice->sync->pack_repository(false, [&](const std::string& m) { messages.push_back(m); });
    ASSERT_TRUE(packed.is_ok()) << packed.error;
    EXPECT_EQ(alice->git->pack_calls, 1);
    EXPECT_FALSE(messages.empty());

    messages.clear();
    ASSERT_TRUE(alice->sync->pack_repository(true, [&](const std::string& m) { messages.push_back(m); }).is_ok());
    EXPECT_TRUE(messages.empty());
    EXPECT_FALSE(fs::exists(alice->lock->lock_path()));
}

TEST_F(SyncManagerTest, PackRefusedWhileSyncRuns) {
    auto alice = make_clone("alice");
    NonFatalSink other_sink;
    SyncLockManager other(alice->dir, alice->config.lock(), other_sink, "other-window");
    ASSERT_TRUE(other.acquire());

    auto packed = alice->sync->pack_repository(true);
    EXPECT_TRUE(packed.is_err());
    EXPECT_EQ(alice->git->pack_calls, 0);
}

TEST_F(SyncManagerTest, RemoteBranchStatus) {
    auto alice = make_clone("alice");
    EXPECT_EQ(alice->sync->remote_branch_status({}).state, RemoteBranchState::NotFound);

    alice->git->write("a.txt", "a");
    ASSERT_EQ(alice->run().status, SyncStatus::Synced);
    auto found = alice->sync->remote_branch_status({});
    EXPECT_EQ(found.state, RemoteBranchState::Found);
    EXPECT_EQ(found.oid.value_or(""), remote_head());

    alice->git->fetch_failures.push(GitErrorKind::Network);
    auto failed = alice->sync->remote_branch_status({});
    EXPECT_EQ(failed.state, RemoteBranchState::Error);
    EXPECT_FALSE(failed.message.empty());
}

// ── Large files ─────────────────────────────────────────────

TEST_F(SyncManagerTest, LargeFilesTravelThroughPointers) {
    auto alice = make_clone("alice", true);
    alice->git->write(FILES + "/audio/take.wav", "wave bytes");

    auto result = alice->run();

    ASSERT_EQ(result.status, SyncStatus::Synced) << result.message;
    std::string pointer_path = POINTERS + "/audio/take.wav";
    EXPECT_EQ(result.lfs.uploaded, std::vector<std::string>{pointer_path});
    EXPECT_EQ(lfs_server.objects[pointer_for_content("wave bytes").oid], "wave bytes");

    // The pointer is published; the payload never enters history
    const auto& head = remote_commit();
    EXPECT_EQ(head.message, "Update large file pointers");
    ASSERT_EQ(head.files.count(pointer_path), 1u);
    EXPECT_EQ(*parse_pointer(head.files.at(pointer_path)), pointer_for_content("wave bytes"));
    for (const auto& [path, content] : head.files) {
        EXPECT_NE(path.rfind(FILES, 0), 0u) << path;
    }

    auto bob = make_clone("bob", true);
    auto pulled = bob->run();
    ASSERT_EQ(pulled.status, SyncStatus::Synced) << pulled.message;
    EXPECT_EQ(pulled.lfs.downloaded, std::vector<std::string>{pointer_path});
    EXPECT_EQ(platform::read_file(bob->dir / FILES / "audio/take.wav").value_or(""), "wave bytes");
}

TEST_F(SyncManagerTest, LfsAuthFailureFailsSync) {
    auto alice = make_clone("alice", true);
    alice->git->write(FILES + "/a.bin", "bytes");
    lfs_server.batch_statuses.push(401);

    auto result = alice->run();

    EXPECT_EQ(result.status, SyncStatus::AuthFailed);
    EXPECT_FALSE(fs::exists(alice->lock->lock_path()));
}

TEST_F(SyncManagerTest, StatusNames) {
    EXPECT_EQ(sync_status_name(SyncStatus::Synced), "synced");
    EXPECT_EQ(sync_status_name(SyncStatus::AlreadyRunning), "already-running");
    EXPECT_EQ(sync_status_name(SyncStatus::Offline), "offline");
}
