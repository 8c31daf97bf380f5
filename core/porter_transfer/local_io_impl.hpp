// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_LOCAL_IO_IMPL_HPP
#define PORTER_LOCAL_IO_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>

#include "local_io_interfaces.hpp"

namespace porter {
namespace transfer {

/**
 * IFileSystem over std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool is_regular_file(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
  }

  bool create_directories(const std::string& path) const override {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
  }
};

/**
 * IInputFile over std::ifstream; reads are serialized by a mutex
 */
class InputFileImpl : public IInputFile {
public:
  explicit InputFileImpl(const std::string& path)
      : stream_(path, std::ios::in | std::ios::binary) {}

  bool good() const {
    return stream_.good();
  }

  bool read_at(uint64_t offset, uint64_t size, Bytes& out) override {
    std::lock_guard<std::mutex> lock(mutex_);
    out.resize(static_cast<size_t>(size));
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (size > 0) {
      stream_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
    }
    return !stream_.fail() && static_cast<uint64_t>(stream_.gcount()) == size;
  }

private:
  std::ifstream stream_;
  std::mutex mutex_;
};

/**
 * IOutputFile over std::ofstream (truncating)
 */
class OutputFileImpl : public IOutputFile {
public:
  explicit OutputFileImpl(const std::string& path)
      : stream_(path, std::ios::out | std::ios::binary | std::ios::trunc) {}

  bool good() const {
    return stream_.good();
  }

  bool write(const Bytes& data) override {
    stream_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return stream_.good();
  }

  bool close() override {
    stream_.close();
    return !stream_.fail();
  }

private:
  std::ofstream stream_;
};

/**
 * Default IFileStreamFactory
 */
class FileStreamFactoryImpl : public IFileStreamFactory {
public:
  std::unique_ptr<IInputFile> open_input(const std::string& path) override {
    auto file = std::make_unique<InputFileImpl>(path);
    if (!file->good()) {
      return nullptr;
    }
    return file;
  }

  std::unique_ptr<IOutputFile> open_output(const std::string& path) override {
    auto file = std::make_unique<OutputFileImpl>(path);
    if (!file->good()) {
      return nullptr;
    }
    return file;
  }
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_LOCAL_IO_IMPL_HPP
