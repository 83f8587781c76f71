#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include "sync/sync_engine.hpp"
#include "sync/fingerprint.hpp"
#include "store/local_object_store.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace s3sync::sync;
using s3sync::store::LocalObjectStore;
using s3sync::store::CallContext;

// Engine behaviour against a real filesystem-backed bucket
class SyncEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
        config.store_root = (dir / "buckets").string();
        config.bucket = "sync-bucket";
        store = std::make_unique<LocalObjectStore>(config);
        engine = std::make_unique<SyncEngine>(*store, config, out);
    }

    std::string remote_md5(const std::string& key) {
        auto info = store->head(key, ctx);
        return info ? remote_checksum(*info) : "";
    }

    void put(const std::string& key, const std::string& content) {
        auto path = dir / "staging";
        write_file(path, content);
        store->upload(path, key, {}, nullptr, ctx);
    }

    TempDir dir{"sync_engine_test"};
    s3sync::config::SyncConfig config;
    std::unique_ptr<LocalObjectStore> store;
    std::unique_ptr<SyncEngine> engine;
    std::ostringstream out;
    CallContext ctx;
};

//==============================================
// UPLOAD
//==============================================

TEST_F(SyncEngineTest, UploadToAbsentKey) {
    auto local = dir / "a.txt";
    write_file(local, "alpha content");

    auto result = engine->upload_files({local.string()}, {"data/a.txt"});

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_EQ(remote_md5("data/a.txt"), s3sync::crypto::md5_hex("alpha content"));
    EXPECT_NE(out.str().find("13 / 13 (100.00%)"), std::string::npos);
}

TEST_F(SyncEngineTest, UploadTwiceSkipsUnchangedFile) {
    auto local = dir / "a.txt";
    write_file(local, "same bytes");

    ASSERT_EQ(engine->upload_files({local.string()}, {"k"}).succeeded(), 1u);
    auto second = engine->upload_files({local.string()}, {"k"});

    EXPECT_EQ(second.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(second.at(0).reason, "unchanged");
}

TEST_F(SyncEngineTest, UploadReplacesChangedContent) {
    put("k", "old");
    auto local = dir / "a.txt";
    write_file(local, "new");

    auto result = engine->upload_files({local.string()}, {"k"});
    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_EQ(remote_md5("k"), s3sync::crypto::md5_hex("new"));
}

TEST_F(SyncEngineTest, UploadStripsBucketFromFullyQualifiedKey) {
    auto local = dir / "a.txt";
    write_file(local, "qualified");

    auto result = engine->upload_files({local.string()}, {"s3://other-bucket/nested/a.txt"});
    EXPECT_EQ(result.at(0).destination, "nested/a.txt");
    EXPECT_TRUE(store->head("nested/a.txt", ctx).has_value());
}

TEST_F(SyncEngineTest, UploadPassesAclAndEncryption) {
    auto local = dir / "a.txt";
    write_file(local, "options");

    engine->upload_files({local.string()}, {"opts"}, true, true);
    auto options = store->options_of("opts");
    EXPECT_EQ(options.acl, "public-read");
    EXPECT_EQ(options.server_side_encryption, "AES256");
}

TEST_F(SyncEngineTest, UploadSkipsDirectoriesAndFailsMissingFiles) {
    std::filesystem::create_directories(dir / "folder");
    write_file(dir / "ok.txt", "ok");

    auto result = engine->upload_files(
        {(dir / "folder").string(), (dir / "missing.txt").string(), (dir / "ok.txt").string()},
        {"folder", "missing", "ok"});

    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(result.at(1).outcome, Outcome::Failed);
    EXPECT_EQ(result.at(2).outcome, Outcome::Succeeded);
    EXPECT_FALSE(store->head("folder", ctx).has_value());
}

TEST_F(SyncEngineTest, MultipartObjectIsReuploadedEvenWhenUnchanged) {
    config.multipart_threshold = 1024;
    config.part_size = 1024;
    store = std::make_unique<LocalObjectStore>(config);
    engine = std::make_unique<SyncEngine>(*store, config, out);

    auto local = dir / "big.bin";
    write_file(local, std::string(4096, 'm'));

    engine->upload_files({local.string()}, {"big"});
    auto second = engine->upload_files({local.string()}, {"big"});

    // Part ETags never equal the whole-file MD5
    EXPECT_EQ(second.at(0).outcome, Outcome::Succeeded);
}

TEST_F(SyncEngineTest, MismatchedListsProcessNothing) {
    write_file(dir / "a", "a");
    write_file(dir / "b", "b");
    write_file(dir / "c", "c");

    EXPECT_THROW(engine->upload_files({(dir / "a").string(), (dir / "b").string(), (dir / "c").string()},
                                      {"a", "b"}),
                 ContractViolation);
    EXPECT_TRUE(store->list("", ctx).empty());
    EXPECT_THROW(engine->download_files({"a"}, {}), ContractViolation);
    EXPECT_THROW(engine->rename_keys({"a", "b"}, {"c"}), ContractViolation);
}

//==============================================
// DOWNLOAD
//==============================================

TEST_F(SyncEngineTest, DownloadCreatesParentDirectories) {
    put("remote/file.txt", "downloaded");
    auto local = dir / "deep" / "nested" / "file.txt";

    auto result = engine->download_files({"remote/file.txt"}, {local.string()});

    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_EQ(read_file(local), "downloaded");
}

TEST_F(SyncEngineTest, DownloadSkipsMatchingLocalFile) {
    put("k", "identical");
    auto local = dir / "k.txt";
    write_file(local, "identical");

    auto result = engine->download_files({"k"}, {local.string()});
    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(result.at(0).reason, "already downloaded");
}

TEST_F(SyncEngineTest, DownloadOverwritesChangedLocalFile) {
    put("k", "remote version");
    auto local = dir / "k.txt";
    write_file(local, "local version");

    auto result = engine->download_files({"k"}, {local.string()});
    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_EQ(read_file(local), "remote version");
}

TEST_F(SyncEngineTest, DownloadNeverWritesIntoDirectory) {
    put("k", "content");
    auto target = dir / "target";
    std::filesystem::create_directories(target);

    auto result = engine->download_files({"k"}, {target.string()});

    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(result.at(0).reason, "destination is a directory");
    EXPECT_TRUE(std::filesystem::is_directory(target));
    EXPECT_TRUE(std::filesystem::is_empty(target));
}

TEST_F(SyncEngineTest, DownloadOfMissingKeyContinuesBatch) {
    put("present", "here");

    auto result = engine->download_files({"absent", "present"},
                                         {(dir / "absent").string(), (dir / "present").string()});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(result.at(1).outcome, Outcome::Succeeded);
    EXPECT_FALSE(std::filesystem::exists(dir / "absent"));
}

//==============================================
// RENAME
//==============================================

TEST_F(SyncEngineTest, RenameMovesKey) {
    put("old/a", "moving");
    std::string original = remote_md5("old/a");

    auto result = engine->rename_keys({"old/a"}, {"new/a"});

    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_FALSE(store->head("old/a", ctx).has_value());
    EXPECT_EQ(remote_md5("new/a"), original);
}

TEST_F(SyncEngineTest, RenameWithKeepOriginalLeavesBoth) {
    put("old/a", "kept");

    auto result = engine->rename_keys({"old/a"}, {"new/a"}, true);

    EXPECT_EQ(result.at(0).outcome, Outcome::Succeeded);
    EXPECT_EQ(remote_md5("old/a"), remote_md5("new/a"));
}

TEST_F(SyncEngineTest, RenameNeverOverwritesExistingDestination) {
    put("old/a", "source");
    put("new/a", "destination");
    std::string src_before = remote_md5("old/a");
    std::string dst_before = remote_md5("new/a");

    auto result = engine->rename_keys({"old/a"}, {"new/a"}, false);

    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_EQ(result.at(0).reason, "destination exists");
    EXPECT_EQ(remote_md5("old/a"), src_before);
    EXPECT_EQ(remote_md5("new/a"), dst_before);
}

TEST_F(SyncEngineTest, RenameMakesCopyPublic) {
    put("old/a", "public");
    engine->rename_keys({"old/a"}, {"pub/a"}, false, true);
    EXPECT_EQ(store->options_of("pub/a").acl, "public-read");
}

TEST_F(SyncEngineTest, RenameOfMissingSourceIsSkipped) {
    auto result = engine->rename_keys({"ghost"}, {"anything"});
    EXPECT_EQ(result.at(0).outcome, Outcome::Skipped);
    EXPECT_FALSE(store->head("anything", ctx).has_value());
}

//==============================================
// DELETE AND LIST
//==============================================

TEST_F(SyncEngineTest, DeleteKeysIncludingAbsentOnes) {
    put("a", "1");
    put("b", "2");

    auto result = engine->delete_keys({"a", "never-existed", "b"});

    EXPECT_EQ(result.succeeded(), 3u);
    EXPECT_TRUE(store->list("", ctx).empty());
}

TEST_F(SyncEngineTest, ListChecksumsFiltersBySubstring) {
    put("run/matrix_data_1", "m1");
    put("run/other", "o");
    put("run/matrix_data_2", "m2");
    put("elsewhere/matrix_data", "x");

    auto listing = engine->list_checksums("run/", "matrix_data");

    ASSERT_EQ(listing.size(), 2u);
    EXPECT_EQ(listing[0].first, "run/matrix_data_1");
    EXPECT_EQ(listing[0].second, s3sync::crypto::md5_hex("m1"));
    EXPECT_EQ(listing[1].first, "run/matrix_data_2");
    EXPECT_NE(out.str().find("filename: run/matrix_data_1"), std::string::npos);
}

TEST_F(SyncEngineTest, EveryPairProducesOneOutcome) {
    put("exists", "x");
    write_file(dir / "up1", "u1");
    write_file(dir / "up2", "u2");

    auto uploads = engine->upload_files({(dir / "up1").string(), (dir / "nope").string(), (dir / "up2").string()},
                                        {"u1", "u2", "u3"});
    auto renames = engine->rename_keys({"exists", "u1", "missing", "u3"}, {"u1", "r1", "r2", "r3"});

    EXPECT_EQ(uploads.size(), 3u);
    EXPECT_EQ(uploads.succeeded() + uploads.skipped() + uploads.failed(), 3u);
    EXPECT_EQ(renames.size(), 4u);
    EXPECT_EQ(renames.succeeded() + renames.skipped() + renames.failed(), 4u);
    for (size_t i = 0; i < renames.size(); ++i) {
        EXPECT_EQ(renames.at(i).index, i);
    }
}
