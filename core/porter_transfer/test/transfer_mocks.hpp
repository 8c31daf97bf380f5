// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_MOCKS_HPP
#define PORTER_TRANSFER_MOCKS_HPP

#include <gmock/gmock.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "local_io_interfaces.hpp"
#include "remote_store.hpp"

namespace porter {
namespace transfer {
namespace test {

/**
 * Mock implementation of IRemoteStore for testing
 */
class MockRemoteStore : public IRemoteStore {
public:
  MOCK_METHOD(
    std::string, putObject, (const PutObjectRequest& request, const Bytes& body), (override)
  );
  MOCK_METHOD(
    std::unique_ptr<IObjectBody>, getObject,
    (const std::string& key, const std::optional<ByteRange>& range), (override)
  );
  MOCK_METHOD(FileInfo, headObject, (const std::string& key), (override));
  MOCK_METHOD(
    ListObjectsResult, listObjectsV2, (const ListObjectsRequest& request), (override)
  );
  MOCK_METHOD(void, deleteObject, (const std::string& key), (override));
  MOCK_METHOD(
    DeleteObjectsResult, deleteObjects, (const std::vector<std::string>& keys), (override)
  );
  MOCK_METHOD(std::string, copyObject, (const CopyObjectRequest& request), (override));
  MOCK_METHOD(
    std::string, createMultipartUpload, (const PutObjectRequest& request), (override)
  );
  MOCK_METHOD(
    std::string, uploadPart,
    (const std::string& key, const std::string& upload_id, int part_number, const Bytes& body),
    (override)
  );
  MOCK_METHOD(
    std::string, completeMultipartUpload,
    (const std::string& key, const std::string& upload_id,
     const std::vector<CompletedPart>& parts),
    (override)
  );
  MOCK_METHOD(
    void, abortMultipartUpload, (const std::string& key, const std::string& upload_id),
    (override)
  );
  MOCK_METHOD(
    std::string, generatePresignedUrl,
    (const std::string& key, PresignOperation operation, int64_t expiry_seconds), (override)
  );
  MOCK_METHOD(const std::string&, bucket, (), (const, override));
};

/**
 * Mock implementation of IFileSystem for testing
 */
class MockFileSystem : public IFileSystem {
public:
  MOCK_METHOD(bool, is_regular_file, (const std::string& path), (const, override));
  MOCK_METHOD(uint64_t, file_size, (const std::string& path), (const, override));
  MOCK_METHOD(bool, create_directories, (const std::string& path), (const, override));
};

/**
 * Mock implementation of IInputFile for testing
 */
class MockInputFile : public IInputFile {
public:
  MOCK_METHOD(bool, read_at, (uint64_t offset, uint64_t size, Bytes& out), (override));
};

/**
 * Mock implementation of IOutputFile for testing
 */
class MockOutputFile : public IOutputFile {
public:
  MOCK_METHOD(bool, write, (const Bytes& data), (override));
  MOCK_METHOD(bool, close, (), (override));
};

/**
 * Mock implementation of IFileStreamFactory for testing
 */
class MockFileStreamFactory : public IFileStreamFactory {
public:
  MOCK_METHOD(std::unique_ptr<IInputFile>, open_input, (const std::string& path), (override));
  MOCK_METHOD(std::unique_ptr<IOutputFile>, open_output, (const std::string& path), (override));
};

}  // namespace test
}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_MOCKS_HPP
