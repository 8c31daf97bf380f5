// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_TEST_HELPERS_HPP
#define PORTER_TRANSFER_TEST_HELPERS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {
namespace test {

namespace fs = std::filesystem;

/**
 * Create a fresh temporary directory
 */
inline std::string createTempDir(const std::string& prefix = "porter_test_") {
  static std::atomic<int> counter{0};
  std::string dir = (fs::temp_directory_path() /
                     (prefix + std::to_string(
                                 std::chrono::steady_clock::now().time_since_epoch().count()
                               ) +
                      "_" + std::to_string(counter++)))
                      .string();
  fs::create_directories(dir);
  return dir;
}

inline void cleanupTempDir(const std::string& dir) {
  std::error_code ec;
  fs::remove_all(dir, ec);
}

/**
 * Deterministic payload: byte i is (i * 31 + 7) mod 251
 */
inline Bytes makePattern(size_t size) {
  Bytes data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>((i * 31 + 7) % 251);
  }
  return data;
}

inline Bytes toBytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

inline std::string toString(const Bytes& data) {
  return std::string(data.begin(), data.end());
}

inline std::string writeFile(const std::string& path, const Bytes& data) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return "";
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  return path;
}

inline Bytes readFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

}  // namespace test
}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_TEST_HELPERS_HPP
