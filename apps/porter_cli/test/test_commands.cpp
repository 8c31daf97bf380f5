// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "commands.hpp"
#include "in_memory_remote_store.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

namespace porter {
namespace cli {
namespace test {

using nlohmann::json;
using transfer::Bytes;
using transfer::RemoteStoreError;
using transfer::test::InMemoryRemoteStore;

/**
 * Hands the engine a store that outlives it, so tests can inspect
 * the bucket after a command returns.
 */
class SharedStore : public transfer::IRemoteStore {
public:
  explicit SharedStore(std::shared_ptr<InMemoryRemoteStore> store)
      : store_(std::move(store)) {}

  std::string putObject(const transfer::PutObjectRequest& request, const Bytes& body) override {
    return store_->putObject(request, body);
  }
  std::unique_ptr<transfer::IObjectBody> getObject(
    const std::string& key, const std::optional<transfer::ByteRange>& range
  ) override {
    return store_->getObject(key, range);
  }
  transfer::FileInfo headObject(const std::string& key) override {
    return store_->headObject(key);
  }
  transfer::ListObjectsResult listObjectsV2(const transfer::ListObjectsRequest& request) override {
    return store_->listObjectsV2(request);
  }
  void deleteObject(const std::string& key) override {
    store_->deleteObject(key);
  }
  transfer::DeleteObjectsResult deleteObjects(const std::vector<std::string>& keys) override {
    return store_->deleteObjects(keys);
  }
  std::string copyObject(const transfer::CopyObjectRequest& request) override {
    return store_->copyObject(request);
  }
  std::string createMultipartUpload(const transfer::PutObjectRequest& request) override {
    return store_->createMultipartUpload(request);
  }
  std::string uploadPart(
    const std::string& key, const std::string& upload_id, int part_number, const Bytes& body
  ) override {
    return store_->uploadPart(key, upload_id, part_number, body);
  }
  std::string completeMultipartUpload(
    const std::string& key, const std::string& upload_id,
    const std::vector<transfer::CompletedPart>& parts
  ) override {
    return store_->completeMultipartUpload(key, upload_id, parts);
  }
  void abortMultipartUpload(const std::string& key, const std::string& upload_id) override {
    store_->abortMultipartUpload(key, upload_id);
  }
  std::string generatePresignedUrl(
    const std::string& key, transfer::PresignOperation operation, int64_t expiry_seconds
  ) override {
    return store_->generatePresignedUrl(key, operation, expiry_seconds);
  }
  const std::string& bucket() const override {
    return store_->bucket();
  }

private:
  std::shared_ptr<InMemoryRemoteStore> store_;
};

class CommandsTest : public ::testing::Test {
protected:
  void SetUp() override {
    unsetenv("PORTER_CONFIG");
    unsetenv("PORTER_BUCKET");
    test_dir_ = transfer::test::createTempDir("porter_cli_test_");
    store_ = std::make_shared<InMemoryRemoteStore>("cli-bucket");

    config_path_ = (test_dir_ / "porter.yaml").string();
    std::ofstream config(config_path_);
    config << "storage:\n"
              "  bucket: cli-bucket\n"
              "retry:\n"
              "  max_attempts: 2\n"
              "  base_delay_ms: 1\n"
              "  jitter: false\n"
              "logging:\n"
              "  console:\n"
              "    enabled: false\n";
  }

  void TearDown() override {
    transfer::test::cleanupTempDir(test_dir_.string());
  }

  int run(std::vector<std::string> args, const std::string& input = "") {
    out_.str("");
    err_.str("");
    std::istringstream in(input);

    args.insert(args.begin(), "porter_cli");
    args.push_back("--config");
    args.push_back(config_path_);
    std::vector<char*> argv;
    for (auto& arg : args) {
      argv.push_back(&arg[0]);
    }

    auto store = store_;
    Commands commands(
      [store](const CliConfig&) { return std::make_unique<SharedStore>(store); }, in, out_, err_
    );
    return commands.execute(static_cast<int>(argv.size()), argv.data());
  }

  json output() const {
    return json::parse(out_.str());
  }

  json error() const {
    return json::parse(err_.str());
  }

  void put(const std::string& key, const std::string& data) {
    store_->putRaw(key, transfer::test::toBytes(data), "text/plain", {});
  }

  fs::path test_dir_;
  std::string config_path_;
  std::shared_ptr<InMemoryRemoteStore> store_;
  std::ostringstream out_;
  std::ostringstream err_;
};

// =============================================================================
// Argument handling
// =============================================================================

TEST_F(CommandsTest, HelpReturnsZero) {
  EXPECT_EQ(run({"help"}), kExitSuccess);
  EXPECT_NE(out_.str().find("Usage: porter_cli"), std::string::npos);
}

TEST_F(CommandsTest, UnknownCommandIsUsageError) {
  EXPECT_EQ(run({"frobnicate"}), kExitUsage);
  EXPECT_NE(err_.str().find("Unknown command"), std::string::npos);
}

TEST_F(CommandsTest, MissingArgumentsIsUsageError) {
  EXPECT_EQ(run({"download", "only-key"}), kExitUsage);
  EXPECT_EQ(run({"info"}), kExitUsage);
}

TEST_F(CommandsTest, MissingOptionValueIsUsageError) {
  std::vector<std::string> args = {"porter_cli", "list", "--max"};
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  std::istringstream in;
  Commands commands(
    [this](const CliConfig&) { return std::make_unique<SharedStore>(store_); }, in, out_, err_
  );

  EXPECT_EQ(commands.execute(static_cast<int>(argv.size()), argv.data()), kExitUsage);
}

TEST_F(CommandsTest, UnknownOptionIsUsageError) {
  EXPECT_EQ(run({"list", "--recursive"}), kExitUsage);
}

TEST_F(CommandsTest, InvalidConfigIsUsageError) {
  std::ofstream(config_path_, std::ios::trunc) << "transfer:\n  multipart_chunk_size_mb: 1\n";

  EXPECT_EQ(run({"list"}), kExitUsage);
  EXPECT_NE(err_.str().find("storage.bucket is required"), std::string::npos);
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(CommandsTest, UploadPrintsResult) {
  const fs::path file = transfer::test::writeFile(
    (test_dir_ / "notes.txt").string(), transfer::test::toBytes("hello porter")
  );

  ASSERT_EQ(run({"upload", file.string(), "docs/notes.txt"}), kExitSuccess);

  const json result = output();
  EXPECT_EQ(result["key"], "docs/notes.txt");
  EXPECT_EQ(result["size"], 12);
  EXPECT_EQ(result["upload_type"], "simple");
  ASSERT_TRUE(store_->contains("docs/notes.txt"));
  EXPECT_EQ(store_->object("docs/notes.txt")->content_type, "text/plain");
}

TEST_F(CommandsTest, UploadDefaultsKeyToFileName) {
  const fs::path file =
    transfer::test::writeFile((test_dir_ / "data.bin").string(), transfer::test::makePattern(64));

  ASSERT_EQ(run({"upload", file.string(), "--content-type", "application/x-test"}), kExitSuccess);

  ASSERT_TRUE(store_->contains("data.bin"));
  EXPECT_EQ(store_->object("data.bin")->content_type, "application/x-test");
}

TEST_F(CommandsTest, UploadMissingFileIsNotFound) {
  EXPECT_EQ(run({"upload", (test_dir_ / "absent").string(), "k"}), kExitNotFound);
  EXPECT_EQ(error()["error"]["kind"], "not_found");
}

TEST_F(CommandsTest, UploadStreamReadsInput) {
  ASSERT_EQ(run({"upload-stream", "piped.log"}, "streamed bytes"), kExitSuccess);

  EXPECT_EQ(output()["upload_type"], "stream");
  ASSERT_TRUE(store_->contains("piped.log"));
  EXPECT_EQ(transfer::test::toString(store_->object("piped.log")->data), "streamed bytes");
}

TEST_F(CommandsTest, DownloadWritesFile) {
  put("reports/q1.csv", "a,b,c\n1,2,3\n");
  const fs::path dest = test_dir_ / "out" / "q1.csv";

  ASSERT_EQ(run({"download", "reports/q1.csv", dest.string()}), kExitSuccess);

  EXPECT_EQ(output()["size"], 12);
  EXPECT_EQ(transfer::test::toString(transfer::test::readFile(dest.string())), "a,b,c\n1,2,3\n");
}

TEST_F(CommandsTest, CatWritesByteRange) {
  put("alphabet", "abcdefghij");

  ASSERT_EQ(run({"cat", "alphabet", "2", "5"}), kExitSuccess);
  EXPECT_EQ(out_.str(), "cdef");

  ASSERT_EQ(run({"cat", "alphabet"}), kExitSuccess);
  EXPECT_EQ(out_.str(), "abcdefghij");
}

TEST_F(CommandsTest, CatRejectsNonNumericRange) {
  put("alphabet", "abcdefghij");

  EXPECT_EQ(run({"cat", "alphabet", "two"}), kExitUsage);
}

TEST_F(CommandsTest, InfoReportsMetadata) {
  store_->putRaw("img.png", transfer::test::toBytes("png"), "image/png", {{"camera", "front"}});

  ASSERT_EQ(run({"info", "img.png"}), kExitSuccess);

  const json result = output();
  EXPECT_EQ(result["size"], 3);
  EXPECT_EQ(result["content_type"], "image/png");
  EXPECT_EQ(result["metadata"]["camera"], "front");
}

TEST_F(CommandsTest, InfoOnMissingKeyExitsNotFound) {
  EXPECT_EQ(run({"info", "ghost"}), kExitNotFound);

  const json err = error();
  EXPECT_EQ(err["error"]["kind"], "not_found");
  EXPECT_EQ(err["error"]["operation"], "get_file_info");
}

TEST_F(CommandsTest, ExistsAlwaysSucceeds) {
  put("present", "x");

  ASSERT_EQ(run({"exists", "present"}), kExitSuccess);
  EXPECT_TRUE(output()["exists"].get<bool>());

  ASSERT_EQ(run({"exists", "absent"}), kExitSuccess);
  EXPECT_FALSE(output()["exists"].get<bool>());
}

TEST_F(CommandsTest, ListPagesThroughPrefix) {
  put("logs/a", "1");
  put("logs/b", "2");
  put("logs/c", "3");
  put("other", "4");

  ASSERT_EQ(run({"list", "logs/", "--max", "2"}), kExitSuccess);
  json page = output();
  ASSERT_EQ(page["files"].size(), 2u);
  EXPECT_TRUE(page["is_truncated"].get<bool>());
  const std::string token = page["next_continuation_token"];

  ASSERT_EQ(run({"list", "logs/", "--token", token}), kExitSuccess);
  page = output();
  ASSERT_EQ(page["files"].size(), 1u);
  EXPECT_EQ(page["files"][0]["key"], "logs/c");
  EXPECT_FALSE(page["is_truncated"].get<bool>());
}

TEST_F(CommandsTest, DeleteSingleAndBatch) {
  put("one", "1");
  put("two", "2");
  put("three", "3");

  ASSERT_EQ(run({"delete", "one"}), kExitSuccess);
  EXPECT_TRUE(output()["deleted"]["one"].get<bool>());
  EXPECT_FALSE(store_->contains("one"));

  ASSERT_EQ(run({"delete", "two", "three"}), kExitSuccess);
  EXPECT_FALSE(store_->contains("two"));
  EXPECT_FALSE(store_->contains("three"));
}

TEST_F(CommandsTest, PartialBatchDeleteExitsFailure) {
  put("keep", "1");
  put("drop", "2");
  store_->rejectDelete("keep");

  EXPECT_EQ(run({"delete", "keep", "drop"}), kExitFailure);

  const json result = output();
  EXPECT_FALSE(result["deleted"]["keep"].get<bool>());
  EXPECT_TRUE(result["deleted"]["drop"].get<bool>());
}

TEST_F(CommandsTest, CopyKeepsSource) {
  put("src", "payload");

  ASSERT_EQ(run({"copy", "src", "dst"}), kExitSuccess);

  EXPECT_EQ(output()["destination_key"], "dst");
  EXPECT_TRUE(store_->contains("src"));
  EXPECT_TRUE(store_->contains("dst"));
}

TEST_F(CommandsTest, CopyFromForeignBucketFails) {
  put("src", "payload");

  EXPECT_EQ(run({"copy", "src", "dst", "--source-bucket", "elsewhere"}), kExitFailure);
  EXPECT_EQ(error()["error"]["kind"], "bucket_missing");
}

TEST_F(CommandsTest, MoveRemovesSource) {
  put("old", "payload");

  ASSERT_EQ(run({"move", "old", "new"}), kExitSuccess);

  EXPECT_FALSE(store_->contains("old"));
  EXPECT_TRUE(store_->contains("new"));
  EXPECT_TRUE(output().contains("move_time"));
}

TEST_F(CommandsTest, PresignBuildsUrl) {
  ASSERT_EQ(run({"presign", "share.zip", "put", "--expiry", "120"}), kExitSuccess);

  const json result = output();
  EXPECT_EQ(result["method"], "PUT");
  EXPECT_NE(result["url"].get<std::string>().find("X-Amz-Expires=120"), std::string::npos);
}

TEST_F(CommandsTest, PresignRejectsUnknownOperation) {
  EXPECT_EQ(run({"presign", "share.zip", "delete"}), kExitUsage);
}

TEST_F(CommandsTest, PresignExpiryAboveMaximumFails) {
  EXPECT_EQ(run({"presign", "share.zip", "--expiry", "999999999"}), kExitFailure);
}

TEST_F(CommandsTest, SetMetadataReplacesMetadata) {
  store_->putRaw("doc", transfer::test::toBytes("x"), "text/plain", {{"old", "1"}});

  ASSERT_EQ(run({"set-metadata", "doc", "owner=ops", "stage=raw"}), kExitSuccess);

  const auto stored = store_->object("doc");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->metadata.size(), 2u);
  EXPECT_EQ(stored->metadata.at("owner"), "ops");
  EXPECT_EQ(output()["metadata"]["stage"], "raw");
}

TEST_F(CommandsTest, SetMetadataRejectsMalformedPair) {
  put("doc", "x");

  EXPECT_EQ(run({"set-metadata", "doc", "novalue"}), kExitUsage);
}

// =============================================================================
// Exit codes
// =============================================================================

TEST_F(CommandsTest, AccessDeniedExitsFour) {
  store_->failNext("head_object", RemoteStoreError("AccessDenied", "denied", 403), 2);

  EXPECT_EQ(run({"info", "secret"}), kExitAccessDenied);
  EXPECT_EQ(error()["error"]["provider_code"], "AccessDenied");
}

TEST_F(CommandsTest, InvalidKeyExitsFive) {
  EXPECT_EQ(run({"info", "///"}), kExitRejected);
  EXPECT_EQ(error()["error"]["kind"], "invalid_key");
}

TEST(ExitCodeTest, MapsEveryKind) {
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::NotFound), kExitNotFound);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::PermissionDenied), kExitAccessDenied);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::AuthFailure), kExitAccessDenied);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::SizeExceeded), kExitRejected);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::InvalidKey), kExitRejected);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::BucketMissing), kExitFailure);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::RateLimited), kExitFailure);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::MultipartFailure), kExitFailure);
  EXPECT_EQ(exit_code_for(transfer::ErrorKind::Generic), kExitFailure);
}

}  // namespace test
}  // namespace cli
}  // namespace porter
