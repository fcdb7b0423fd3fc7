#include <gtest/gtest.h>
#include <lfs/lfs_reconciler.hpp>
#include <platform/file_ops.hpp>
#include "fakes/fake_lfs_server.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

static const std::string POINTERS = ".project/attachments/pointers";
static const std::string FILES = ".project/attachments/files";

class LfsReconcilerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeLfsServer server;
    NonFatalSink sink;
    std::unique_ptr<LfsClient> client;

    void SetUp() override {
        test_dir = fs::temp_directory_path() /
            ("tandem_lfs_reconciler_test_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);

        RetryPolicy retry;
        retry.max_attempts = 2;
        retry.base_delay_ms = 1;
        retry.sleep = [](int) {};
        client = std::make_unique<LfsClient>(
            server, [](TransferDirection) { return LfsEndpoint{FakeLfsServer::BASE, {}}; }, retry);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    LfsReconciler make(MediaStrategy strategy = MediaStrategy::AutoDownload) {
        LfsSettings settings;
        settings.media_strategy = strategy;
        return LfsReconciler(test_dir, settings, *client, sink);
    }

    void write(const std::string& rel, const std::string& content) {
        auto file = test_dir / rel;
        fs::create_directories(file.parent_path());
        std::ofstream(file, std::ios::binary) << content;
    }

    std::string read(const std::string& rel) {
        return platform::read_file(test_dir / rel).value_or("");
    }

    // Pointer at <pointers>/<name> describing `content`
    void add_pointer(const std::string& name, const std::string& content) {
        write(POINTERS + "/" + name, format_pointer(pointer_for_content(content)));
    }

    void add_payload(const std::string& name, const std::string& content) {
        write(FILES + "/" + name, content);
    }

    static bool has(const std::vector<std::string>& v, const std::string& s) {
        return std::find(v.begin(), v.end(), s) != v.end();
    }
};

TEST_F(LfsReconcilerTest, PathMapping) {
    auto r = make();
    EXPECT_EQ(r.payload_path_for(POINTERS + "/audio/take.wav"), test_dir / FILES / "audio/take.wav");
    EXPECT_EQ(r.pointer_path_for(test_dir / FILES / "audio/take.wav"), POINTERS + "/audio/take.wav");
    EXPECT_TRUE(r.is_pointer_path(POINTERS + "/a.png"));
    EXPECT_FALSE(r.is_pointer_path(FILES + "/a.png"));
    EXPECT_FALSE(r.is_pointer_path(".project/attachments/pointers_old/a.png"));
}

TEST_F(LfsReconcilerTest, ScanFindsMissingAndMismatched) {
    add_pointer("a.wav", "aaaa");
    add_pointer("b.wav", "bbbb");
    add_payload("b.wav", "bbbbbb");
    add_pointer("c.wav", "cccc");
    add_payload("c.wav", "cccc");
    write(POINTERS + "/junk.txt", "not a pointer");

    auto missing = make().scan_missing_payloads();
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0].pointer_path, POINTERS + "/a.wav");
    EXPECT_EQ(missing[1].pointer_path, POINTERS + "/b.wav");
}

TEST_F(LfsReconcilerTest, StrictScanChecksHash) {
    add_pointer("a.wav", "aaaa");
    add_payload("a.wav", "zzzz");   // same size, different bytes

    auto r = make();
    EXPECT_TRUE(r.scan_missing_payloads().empty());
    EXPECT_EQ(r.scan_missing_payloads({POINTERS + "/a.wav"}).size(), 1u);
}

TEST_F(LfsReconcilerTest, DownloadsMissingPayload) {
    server.put_object("audio bytes");
    add_pointer("audio/take.wav", "audio bytes");

    auto report = make().reconcile();

    EXPECT_TRUE(has(report.downloaded, POINTERS + "/audio/take.wav"));
    EXPECT_TRUE(report.failed.empty());
    EXPECT_TRUE(report.rewritten_pointers.empty());
    EXPECT_EQ(read(FILES + "/audio/take.wav"), "audio bytes");
}

TEST_F(LfsReconcilerTest, SharedObjectDownloadedOnce) {
    server.put_object("same bytes");
    add_pointer("one.bin", "same bytes");
    add_pointer("copy/two.bin", "same bytes");

    auto report = make().reconcile();

    EXPECT_EQ(report.downloaded.size(), 2u);
    EXPECT_EQ(server.count("GET"), 1u);
    EXPECT_EQ(read(FILES + "/copy/two.bin"), "same bytes");
}

TEST_F(LfsReconcilerTest, EmptyPointerRegeneratedWithoutNetwork) {
    write(POINTERS + "/clip.mov", "");
    add_payload("clip.mov", "movie bytes");

    auto report = make().reconcile();

    EXPECT_TRUE(has(report.regenerated, POINTERS + "/clip.mov"));
    EXPECT_TRUE(has(report.rewritten_pointers, POINTERS + "/clip.mov"));
    auto pointer = parse_pointer(read(POINTERS + "/clip.mov"));
    ASSERT_TRUE(pointer.has_value());
    EXPECT_EQ(*pointer, pointer_for_content("movie bytes"));
    EXPECT_TRUE(server.requests.empty());
}

TEST_F(LfsReconcilerTest, CorruptPointerWithoutPayloadIsReported) {
    write(POINTERS + "/broken.bin", "garbage");

    auto report = make().reconcile();

    EXPECT_TRUE(report.regenerated.empty());
    EXPECT_TRUE(sink.contains("lfs.recover"));
    EXPECT_EQ(read(POINTERS + "/broken.bin"), "garbage");
}

TEST_F(LfsReconcilerTest, NewPayloadIsUploadedAndPointerWritten) {
    add_payload("photos/new.png", "png bytes");

    auto report = make().reconcile();

    std::string pointer_path = POINTERS + "/photos/new.png";
    EXPECT_TRUE(has(report.uploaded, pointer_path));
    EXPECT_TRUE(has(report.rewritten_pointers, pointer_path));
    EXPECT_EQ(server.objects[pointer_for_content("png bytes").oid], "png bytes");
    auto pointer = parse_pointer(read(pointer_path));
    ASSERT_TRUE(pointer.has_value());
    EXPECT_EQ(*pointer, pointer_for_content("png bytes"));
}

TEST_F(LfsReconcilerTest, LocalEditIsUploadedNotOverwritten) {
    server.put_object("v1");
    add_pointer("doc.pdf", "v1");
    add_payload("doc.pdf", "v2 with more bytes");

    auto report = make().reconcile();

    EXPECT_EQ(server.count("GET"), 0u);
    EXPECT_EQ(read(FILES + "/doc.pdf"), "v2 with more bytes");
    EXPECT_TRUE(has(report.uploaded, POINTERS + "/doc.pdf"));
    EXPECT_EQ(*parse_pointer(read(POINTERS + "/doc.pdf")), pointer_for_content("v2 with more bytes"));
}

TEST_F(LfsReconcilerTest, IncomingPointerReplacesStalePayload) {
    server.put_object("remote v2");
    add_pointer("doc.pdf", "remote v2");
    add_payload("doc.pdf", "local v1");

    ReconcileOptions options;
    options.incoming_pointers = {POINTERS + "/doc.pdf"};
    auto report = make(MediaStrategy::StreamOnly).reconcile(options);

    EXPECT_TRUE(has(report.downloaded, POINTERS + "/doc.pdf"));
    EXPECT_EQ(read(FILES + "/doc.pdf"), "remote v2");
    EXPECT_EQ(server.count("PUT"), 0u);
    EXPECT_TRUE(report.uploaded.empty());
}

TEST_F(LfsReconcilerTest, UploadSkippedWhenServerHasObject) {
    server.put_object("known");
    add_payload("known.bin", "known");

    auto report = make().reconcile();

    EXPECT_EQ(server.count("PUT"), 0u);
    EXPECT_TRUE(has(report.uploaded, POINTERS + "/known.bin"));
    EXPECT_TRUE(parse_pointer(read(POINTERS + "/known.bin")).has_value());
}

TEST_F(LfsReconcilerTest, UploadOmittedFromResponseIsAlreadyStored) {
    server.omit_present_uploads = true;
    server.put_object("known");
    add_payload("known.bin", "known");
    add_payload("fresh.bin", "fresh");

    auto report = make().reconcile();

    EXPECT_TRUE(report.failed.empty());
    EXPECT_EQ(server.count("PUT"), 1u);
    EXPECT_TRUE(has(report.uploaded, POINTERS + "/known.bin"));
    EXPECT_TRUE(has(report.rewritten_pointers, POINTERS + "/known.bin"));
    EXPECT_TRUE(has(report.uploaded, POINTERS + "/fresh.bin"));
    auto pointer = parse_pointer(read(POINTERS + "/known.bin"));
    ASSERT_TRUE(pointer.has_value());
    EXPECT_EQ(*pointer, pointer_for_content("known"));
}

TEST_F(LfsReconcilerTest, PartialDownloadsAreNotUploaded) {
    add_payload("big.bin.download.12345", "half");

    auto r = make();
    EXPECT_TRUE(r.scan_pending_uploads().empty());
}

TEST_F(LfsReconcilerTest, StreamOnlySkipsBulkDownload) {
    server.put_object("stream me");
    add_pointer("audio/stream.wav", "stream me");

    auto r = make(MediaStrategy::StreamOnly);
    auto report = r.reconcile();

    EXPECT_TRUE(has(report.skipped, POINTERS + "/audio/stream.wav"));
    EXPECT_EQ(server.count("GET"), 0u);
    EXPECT_FALSE(fs::exists(test_dir / FILES / "audio/stream.wav"));

    auto fetched = r.fetch_payload(POINTERS + "/audio/stream.wav");
    ASSERT_TRUE(fetched.is_ok()) << fetched.error;
    EXPECT_EQ(fetched.value.parent_path(), r.cache_dir());
    EXPECT_EQ(platform::read_file(fetched.value).value_or(""), "stream me");
    EXPECT_FALSE(fs::exists(test_dir / FILES / "audio/stream.wav"));
    fs::remove(fetched.value);
}

TEST_F(LfsReconcilerTest, StreamAndSaveKeepsFetchedPayload) {
    server.put_object("keep me");
    add_pointer("clip.mov", "keep me");

    auto r = make(MediaStrategy::StreamAndSave);
    auto report = r.reconcile();
    EXPECT_TRUE(has(report.skipped, POINTERS + "/clip.mov"));

    auto fetched = r.fetch_payload(POINTERS + "/clip.mov");
    ASSERT_TRUE(fetched.is_ok()) << fetched.error;
    EXPECT_EQ(fetched.value, test_dir / FILES / "clip.mov");
    EXPECT_EQ(read(FILES + "/clip.mov"), "keep me");

    // Already present: no second transfer
    size_t gets = server.count("GET");
    ASSERT_TRUE(r.fetch_payload(POINTERS + "/clip.mov").is_ok());
    EXPECT_EQ(server.count("GET"), gets);
}

TEST_F(LfsReconcilerTest, FetchPayloadErrors) {
    auto r = make();
    EXPECT_TRUE(r.fetch_payload(POINTERS + "/nothing.bin").is_err());

    write(POINTERS + "/bad.bin", "garbage");
    EXPECT_TRUE(r.fetch_payload(POINTERS + "/bad.bin").is_err());

    add_pointer("absent.bin", "server lacks this");
    auto fetched = r.fetch_payload(POINTERS + "/absent.bin");
    ASSERT_TRUE(fetched.is_err());
    EXPECT_NE(fetched.error.find("absent.bin"), std::string::npos);
}

TEST_F(LfsReconcilerTest, FailedObjectDoesNotStopOthers) {
    server.put_object("available");
    add_pointer("ok.bin", "available");
    add_pointer("lost.bin", "never uploaded");

    auto report = make().reconcile();

    EXPECT_TRUE(has(report.downloaded, POINTERS + "/ok.bin"));
    ASSERT_EQ(report.failed.size(), 1u);
    EXPECT_EQ(report.failed[0].path, POINTERS + "/lost.bin");
    EXPECT_EQ(read(FILES + "/ok.bin"), "available");
}

TEST_F(LfsReconcilerTest, NetworkFailureIsRecorded) {
    server.network_drops = 100;
    add_pointer("a.bin", "aaa");
    add_payload("b.bin", "bbb");

    auto report = make().reconcile();

    EXPECT_EQ(report.failed.size(), 2u);
    EXPECT_TRUE(report.downloaded.empty());
    EXPECT_TRUE(report.uploaded.empty());
    EXPECT_FALSE(fs::exists(test_dir / POINTERS / "b.bin"));
}

TEST_F(LfsReconcilerTest, AuthFailureIsFatal) {
    server.batch_statuses.push(403);
    add_pointer("a.bin", "aaa");

    auto r = make();
    try {
        r.reconcile();
        FAIL() << "expected LfsError";
    } catch (const LfsError& e) {
        EXPECT_EQ(e.kind(), LfsErrorKind::Auth);
    }
}

TEST_F(LfsReconcilerTest, PayloadsAreNeverDeleted) {
    add_payload("local-only.wav", "unsynced take");
    server.network_drops = 100;

    auto r = make();
    r.reconcile();
    EXPECT_EQ(read(FILES + "/local-only.wav"), "unsynced take");

    server.network_drops = 0;
    r.reconcile();
    EXPECT_EQ(read(FILES + "/local-only.wav"), "unsynced take");
}

TEST_F(LfsReconcilerTest, Status) {
    write(".gitattributes", "*.wav filter=lfs diff=lfs merge=lfs -text\n");
    add_pointer("a.wav", "12345");
    add_pointer("b.wav", "123");
    add_payload("b.wav", "123");
    add_payload("c.wav", "new");

    auto status = make().lfs_status();
    EXPECT_EQ(status.tracked_patterns, std::vector<std::string>{"*.wav"});
    EXPECT_EQ(status.pointer_files, 2u);
    EXPECT_EQ(status.total_size, 8u);
    EXPECT_EQ(status.missing_payloads, 1u);
    EXPECT_EQ(status.pending_uploads, 1u);
}

TEST_F(LfsReconcilerTest, EnsurePayloadsIgnored) {
    write(".gitignore", "build/");
    auto r = make();

    auto first = r.ensure_payloads_ignored();
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_TRUE(first.value);
    EXPECT_EQ(read(".gitignore"), "build/\n/" + FILES + "/\n");

    auto second = r.ensure_payloads_ignored();
    ASSERT_TRUE(second.is_ok());
    EXPECT_FALSE(second.value);
}
