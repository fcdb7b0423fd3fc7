#include <gtest/gtest.h>
#include <managers/conflict_detector.hpp>
#include <lfs/pointer.hpp>
#include "fakes/fake_git.hpp"
#include <filesystem>

namespace fs = std::filesystem;

using Files = std::map<std::string, std::string>;

class ConflictDetectorTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::shared_ptr<FakeRemote> remote;
    std::unique_ptr<FakeGit> git;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("tandem_conflicts_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        remote = std::make_shared<FakeRemote>();
        git = std::make_unique<FakeGit>(test_dir, remote);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string commit(const Files& files, std::vector<std::string> parents = {}) {
        FakeCommit c;
        c.files = files;
        c.parents = std::move(parents);
        return remote->store(std::move(c));
    }

    MergePlan plan(const Files& base, const Files& ours, const Files& theirs) {
        auto b = commit(base);
        ConflictDetector detector(*git, ".project/attachments/pointers");
        return detector.plan(commit(ours, {b}), commit(theirs, {b}));
    }

    const Conflict* find(const MergePlan& p, const std::string& path) {
        for (const auto& c : p.conflicts) {
            if (c.filepath == path) return &c;
        }
        return nullptr;
    }
};

TEST(MergeDecisionTest, DecidePath) {
    std::optional<std::string> a = std::string("a");
    std::optional<std::string> b = std::string("b");
    std::optional<std::string> c = std::string("c");
    std::optional<std::string> none;

    EXPECT_EQ(decide_path(a, a, b), MergeDecision::Unchanged);
    EXPECT_EQ(decide_path(none, none, a), MergeDecision::Unchanged);
    EXPECT_EQ(decide_path(a, b, a), MergeDecision::TakeTheirs);
    EXPECT_EQ(decide_path(a, none, a), MergeDecision::TakeTheirs);
    EXPECT_EQ(decide_path(b, a, a), MergeDecision::KeepOurs);
    EXPECT_EQ(decide_path(b, c, a), MergeDecision::Conflict);
    EXPECT_EQ(decide_path(a, b, none), MergeDecision::Conflict);
    EXPECT_EQ(decide_path(none, b, a), MergeDecision::Conflict);
}

TEST_F(ConflictDetectorTest, IdenticalEditsDoNotConflict) {
    auto p = plan({{"notes.txt", "v1"}}, {{"notes.txt", "v2"}}, {{"notes.txt", "v2"}});
    EXPECT_TRUE(p.clean());
    EXPECT_TRUE(p.changes.empty());
}

TEST_F(ConflictDetectorTest, RemoteOnlyChangesAreTaken) {
    auto p = plan({{"a.txt", "1"}, {"gone.txt", "x"}},
                  {{"a.txt", "1"}, {"gone.txt", "x"}},
                  {{"a.txt", "2"}, {"added.txt", "new"}});

    EXPECT_TRUE(p.clean());
    ASSERT_EQ(p.changes.size(), 3u);

    std::map<std::string, std::optional<std::string>> changes;
    for (const auto& c : p.changes) changes[c.path] = c.content;
    EXPECT_EQ(changes["a.txt"], std::optional<std::string>("2"));
    EXPECT_EQ(changes["added.txt"], std::optional<std::string>("new"));
    EXPECT_FALSE(changes["gone.txt"].has_value());
}

TEST_F(ConflictDetectorTest, LocalOnlyChangesAreKept) {
    auto p = plan({{"a.txt", "1"}}, {{"a.txt", "mine"}, {"b.txt", "mine too"}}, {{"a.txt", "1"}});
    EXPECT_TRUE(p.clean());
    EXPECT_TRUE(p.changes.empty());
}

TEST_F(ConflictDetectorTest, BothModified) {
    auto p = plan({{"doc.txt", "base"}}, {{"doc.txt", "ours"}}, {{"doc.txt", "theirs"}});

    ASSERT_EQ(p.conflicts.size(), 1u);
    const auto& c = p.conflicts[0];
    EXPECT_EQ(c.filepath, "doc.txt");
    EXPECT_EQ(c.ours, "ours");
    EXPECT_EQ(c.theirs, "theirs");
    ASSERT_TRUE(c.base.has_value());
    EXPECT_EQ(*c.base, "base");
    EXPECT_FALSE(c.is_new);
    EXPECT_FALSE(c.is_deleted);
    EXPECT_FALSE(c.is_lfs);
}

TEST_F(ConflictDetectorTest, DeleteVersusModify) {
    auto p = plan({{"doc.txt", "base"}}, {}, {{"doc.txt", "theirs"}});

    const auto* c = find(p, "doc.txt");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_deleted);
    EXPECT_FALSE(c->is_new);
    EXPECT_EQ(c->ours, "");
    EXPECT_EQ(c->theirs, "theirs");
}

TEST_F(ConflictDetectorTest, NewOnBothSides) {
    auto p = plan({}, {{"fresh.txt", "mine"}}, {{"fresh.txt", "yours"}});

    const auto* c = find(p, "fresh.txt");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_new);
    EXPECT_FALSE(c->base.has_value());
    EXPECT_FALSE(c->is_deleted);
}

TEST_F(ConflictDetectorTest, PointerPathIsLfs) {
    std::string path = ".project/attachments/pointers/take.wav";
    auto p = plan({{path, format_pointer(pointer_for_content("base"))}},
                  {{path, format_pointer(pointer_for_content("ours"))}},
                  {{path, format_pointer(pointer_for_content("theirs"))}});

    const auto* c = find(p, path);
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_lfs);
}

TEST_F(ConflictDetectorTest, TrackedByAttributesIsLfs) {
    Files base = {{".gitattributes", "*.psd filter=lfs diff=lfs merge=lfs -text\n"}, {"art.psd", "0"}};
    Files ours = base;
    Files theirs = base;
    ours["art.psd"] = "1";
    theirs["art.psd"] = "2";

    auto p = plan(base, ours, theirs);
    const auto* c = find(p, "art.psd");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_lfs);
}

TEST_F(ConflictDetectorTest, PointerTextIsLfs) {
    auto p = plan({{"elsewhere.bin", "plain"}},
                  {{"elsewhere.bin", format_pointer(pointer_for_content("x"))}},
                  {{"elsewhere.bin", "edited"}});

    const auto* c = find(p, "elsewhere.bin");
    ASSERT_NE(c, nullptr);
    EXPECT_TRUE(c->is_lfs);
}

TEST_F(ConflictDetectorTest, TwoConflictsOneCleanPath) {
    auto p = plan({{"local1.txt", "a"}, {"local2.txt", "b"}, {"shared.txt", "s"}},
                  {{"local1.txt", "a1"}, {"local2.txt", "b1"}, {"shared.txt", "s"}},
                  {{"local1.txt", "a2"}, {"local2.txt", "b2"}, {"shared.txt", "s2"}});

    EXPECT_EQ(p.conflicts.size(), 2u);
    EXPECT_NE(find(p, "local1.txt"), nullptr);
    EXPECT_NE(find(p, "local2.txt"), nullptr);
    ASSERT_EQ(p.changes.size(), 1u);
    EXPECT_EQ(p.changes[0].path, "shared.txt");
}

TEST_F(ConflictDetectorTest, UnrelatedHistories) {
    ConflictDetector detector(*git, ".project/attachments/pointers");
    auto ours = commit({{"same.txt", "x"}, {"a.txt", "1"}});
    auto theirs = commit({{"same.txt", "x"}, {"a.txt", "2"}});

    auto p = detector.plan(ours, theirs);
    EXPECT_EQ(p.base, "");
    ASSERT_EQ(p.conflicts.size(), 1u);
    EXPECT_TRUE(p.conflicts[0].is_new);
}
