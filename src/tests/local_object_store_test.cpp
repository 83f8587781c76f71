#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include "store/local_object_store.hpp"
#include "crypto/digest.hpp"
#include "test_utils.hpp"

using namespace s3sync::store;

class LocalObjectStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
        config.store_root = (dir / "buckets").string();
        config.bucket = "test-bucket";
        store = std::make_unique<LocalObjectStore>(config);
    }

    void upload_content(const std::string& key, const std::string& content,
                        const TransferOptions& options = {}) {
        auto path = dir / "upload_src";
        write_file(path, content);
        ASSERT_NO_THROW(store->upload(path, key, options, nullptr, ctx)) << "Failed to upload " << key;
    }

    TempDir dir{"local_store_test"};
    s3sync::config::SyncConfig config;
    std::unique_ptr<LocalObjectStore> store;
    CallContext ctx;
};

TEST_F(LocalObjectStoreTest, HeadOfMissingKeyIsAbsent) {
    EXPECT_FALSE(store->head("nothing/here", ctx).has_value());
}

TEST_F(LocalObjectStoreTest, UploadRecordsMd5Etag) {
    upload_content("data/a.txt", "hello");

    auto info = store->head("data/a.txt", ctx);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->key, "data/a.txt");
    EXPECT_EQ(info->bucket, "test-bucket");
    EXPECT_EQ(info->content_length, 5u);
    EXPECT_EQ(info->etag, "\"" + s3sync::crypto::md5_hex("hello") + "\"");
}

TEST_F(LocalObjectStoreTest, UploadReportsEveryByte) {
    auto path = dir / "src.bin";
    write_file(path, std::string(200 * 1024 + 3, 'z'));

    std::atomic<std::uintmax_t> seen{0};
    store->upload(path, "bytes", {}, [&seen](std::uintmax_t n) { seen += n; }, ctx);
    EXPECT_EQ(seen.load(), 200u * 1024 + 3);
}

TEST_F(LocalObjectStoreTest, UploadOptionsAreRecorded) {
    TransferOptions options;
    options.acl = PUBLIC_READ_ACL;
    options.server_side_encryption = AES256_ENCRYPTION;
    upload_content("secret", "payload", options);

    auto recorded = store->options_of("secret");
    EXPECT_EQ(recorded.acl, "public-read");
    EXPECT_EQ(recorded.server_side_encryption, "AES256");

    upload_content("plain", "payload");
    EXPECT_EQ(store->options_of("plain").acl, "private");
    EXPECT_TRUE(store->options_of("plain").server_side_encryption.empty());
}

TEST_F(LocalObjectStoreTest, MultipartUploadUsesPartEtag) {
    config.multipart_threshold = 1024;
    config.part_size = 1024;
    config.max_part_workers = 3;
    store = std::make_unique<LocalObjectStore>(config);

    std::string content;
    for (int i = 0; i < 2500; ++i) {
        content.push_back(static_cast<char>('a' + i % 26));
    }
    auto path = dir / "multi.bin";
    write_file(path, content);

    std::atomic<std::uintmax_t> seen{0};
    store->upload(path, "multi", {}, [&seen](std::uintmax_t n) { seen += n; }, ctx);
    EXPECT_EQ(seen.load(), content.size());

    // md5 of the concatenated raw part digests, then the part count
    s3sync::crypto::Digest combined(s3sync::crypto::Digest::Algorithm::MD5);
    for (size_t offset = 0; offset < content.size(); offset += 1024) {
        s3sync::crypto::Digest part(s3sync::crypto::Digest::Algorithm::MD5);
        std::string chunk = content.substr(offset, 1024);
        part.update(chunk.data(), chunk.size());
        auto bytes = part.finish();
        combined.update(bytes.data(), bytes.size());
    }

    auto info = store->head("multi", ctx);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->etag, "\"" + combined.finish_hex() + "-3\"");
    EXPECT_EQ(info->content_length, content.size());

    // Content survives the parallel part writes
    auto out = dir / "multi.out";
    store->download("multi", out, nullptr, ctx);
    EXPECT_EQ(read_file(out), content);
}

TEST_F(LocalObjectStoreTest, ListIsSortedAndPrefixed) {
    upload_content("logs/b", "2");
    upload_content("logs/a", "1");
    upload_content("data/c", "3");

    auto all = store->list("", ctx);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].key, "data/c");
    EXPECT_EQ(all[1].key, "logs/a");
    EXPECT_EQ(all[2].key, "logs/b");

    auto logs = store->list("logs/", ctx);
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0].key, "logs/a");
}

TEST_F(LocalObjectStoreTest, CopyKeepsContentAndAppliesAcl) {
    upload_content("src", "copy me");

    TransferOptions options;
    options.acl = PUBLIC_READ_ACL;
    store->copy("src", "dst", options, ctx);

    auto src = store->head("src", ctx);
    auto dst = store->head("dst", ctx);
    ASSERT_TRUE(src && dst);
    EXPECT_EQ(src->etag, dst->etag);
    EXPECT_EQ(store->options_of("dst").acl, "public-read");
    EXPECT_EQ(store->options_of("src").acl, "private");
}

TEST_F(LocalObjectStoreTest, CopyOfMissingSourceThrows) {
    EXPECT_THROW(store->copy("missing", "dst", {}, ctx), ObjectNotFound);
    EXPECT_FALSE(store->head("dst", ctx).has_value());
}

TEST_F(LocalObjectStoreTest, RemoveDeletesAndToleratesAbsentKeys) {
    upload_content("gone", "bye");
    store->remove("gone", ctx);
    EXPECT_FALSE(store->head("gone", ctx).has_value());
    EXPECT_NO_THROW(store->remove("gone", ctx));
    EXPECT_TRUE(store->list("", ctx).empty());
}

TEST_F(LocalObjectStoreTest, DownloadOfMissingKeyThrows) {
    EXPECT_THROW(store->download("missing", dir / "out", nullptr, ctx), ObjectNotFound);
    EXPECT_FALSE(std::filesystem::exists(dir / "out"));
}

TEST_F(LocalObjectStoreTest, EmptyKeyIsRejected) {
    EXPECT_THROW(store->head("", ctx), StoreError);
}

TEST_F(LocalObjectStoreTest, CancelledContextStopsUpload) {
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    CallContext cancelled(std::chrono::milliseconds(0), token);

    auto path = dir / "src";
    write_file(path, "data");
    EXPECT_THROW(store->upload(path, "never", {}, nullptr, cancelled), CallCancelled);
    EXPECT_FALSE(store->head("never", ctx).has_value());
}

TEST_F(LocalObjectStoreTest, InvalidConfigIsRejected) {
    s3sync::config::SyncConfig bad = config;
    bad.bucket = "";
    EXPECT_THROW(LocalObjectStore{bad}, s3sync::config::ConfigError);
}
