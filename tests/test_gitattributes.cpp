#include <gtest/gtest.h>
#include <lfs/gitattributes.hpp>
#include <platform/file_ops.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class GitattributesTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("tandem_gitattributes_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_attributes(const std::string& content) {
        std::ofstream(test_dir / ".gitattributes") << content;
    }

    std::string read_attributes() {
        return platform::read_file(test_dir / ".gitattributes").value_or("");
    }
};

TEST_F(GitattributesTest, NoFileTracksNothing) {
    LfsAttributes attrs(test_dir);
    EXPECT_FALSE(attrs.is_tracked("video.mp4"));
    EXPECT_TRUE(attrs.tracked_patterns().empty());
}

TEST_F(GitattributesTest, ExtensionPattern) {
    write_attributes("*.psd filter=lfs diff=lfs merge=lfs -text\n");
    LfsAttributes attrs(test_dir);

    EXPECT_TRUE(attrs.is_tracked("art.psd"));
    EXPECT_TRUE(attrs.is_tracked("assets/deep/art.psd"));
    EXPECT_FALSE(attrs.is_tracked("art.png"));
}

TEST_F(GitattributesTest, NonFilterLinesIgnored) {
    write_attributes("*.sh text eol=lf\n# *.bin filter=lfs\n\n*.bin filter=lfs\n");
    LfsAttributes attrs(test_dir);

    EXPECT_FALSE(attrs.is_tracked("run.sh"));
    EXPECT_TRUE(attrs.is_tracked("blob.bin"));
    EXPECT_EQ(attrs.tracked_patterns(), std::vector<std::string>{"*.bin"});
}

TEST_F(GitattributesTest, LaterRuleWins) {
    write_attributes("*.wav filter=lfs\nsamples/click.wav -filter\n");
    LfsAttributes attrs(test_dir);

    EXPECT_TRUE(attrs.is_tracked("samples/kick.wav"));
    EXPECT_FALSE(attrs.is_tracked("samples/click.wav"));
}

TEST_F(GitattributesTest, UnsetRemovesPattern) {
    write_attributes("*.zip filter=lfs\n*.zip !filter\n");
    LfsAttributes attrs(test_dir);

    EXPECT_FALSE(attrs.is_tracked("bundle.zip"));
    EXPECT_TRUE(attrs.tracked_patterns().empty());
}

TEST_F(GitattributesTest, DirectoryAndAnchoredPatterns) {
    write_attributes("media/ filter=lfs\n/top.bin filter=lfs\n");
    LfsAttributes attrs(test_dir);

    EXPECT_TRUE(attrs.is_tracked("media/a.txt"));
    EXPECT_TRUE(attrs.is_tracked("media/sub/b.txt"));
    EXPECT_TRUE(attrs.is_tracked("top.bin"));
    EXPECT_FALSE(attrs.is_tracked("nested/top.bin"));
}

TEST_F(GitattributesTest, DoubleStarPattern) {
    write_attributes("data/**/*.h5 filter=lfs\n");
    LfsAttributes attrs(test_dir);

    EXPECT_TRUE(attrs.is_tracked("data/run.h5"));
    EXPECT_TRUE(attrs.is_tracked("data/2025/jan/run.h5"));
    EXPECT_FALSE(attrs.is_tracked("other/run.h5"));
}

TEST_F(GitattributesTest, FromText) {
    auto attrs = LfsAttributes::from_text("*.mov filter=lfs diff=lfs merge=lfs -text\n");
    EXPECT_TRUE(attrs.is_tracked("clip.mov"));
    EXPECT_FALSE(attrs.is_tracked("clip.txt"));
}

TEST_F(GitattributesTest, TrackPatternAppends) {
    write_attributes("*.sh text eol=lf");
    LfsAttributes attrs(test_dir);

    auto r = attrs.track_pattern("*.psd");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(attrs.is_tracked("a.psd"));
    EXPECT_EQ(read_attributes(), "*.sh text eol=lf\n*.psd filter=lfs diff=lfs merge=lfs -text\n");

    // Tracking again is a no-op
    ASSERT_TRUE(attrs.track_pattern("*.psd").is_ok());
    EXPECT_EQ(read_attributes(), "*.sh text eol=lf\n*.psd filter=lfs diff=lfs merge=lfs -text\n");

    LfsAttributes reloaded(test_dir);
    EXPECT_TRUE(reloaded.is_tracked("dir/b.psd"));
}

TEST_F(GitattributesTest, TrackPatternRejectsWhitespace) {
    LfsAttributes attrs(test_dir);
    EXPECT_TRUE(attrs.track_pattern("").is_err());
    EXPECT_TRUE(attrs.track_pattern("my file.psd").is_err());
}

TEST_F(GitattributesTest, TrackPatternNeedsRepository) {
    auto attrs = LfsAttributes::from_text("");
    EXPECT_TRUE(attrs.track_pattern("*.bin").is_err());
}
