// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_LOCAL_IO_INTERFACES_HPP
#define PORTER_LOCAL_IO_INTERFACES_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {

/**
 * Filesystem queries used by the engine
 * Allows mocking local files in tests
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * True if path names an existing regular file
   */
  virtual bool is_regular_file(const std::string& path) const = 0;

  /**
   * Size of a file in bytes
   */
  virtual uint64_t file_size(const std::string& path) const = 0;

  /**
   * Create a directory tree; succeeds if it already exists
   */
  virtual bool create_directories(const std::string& path) const = 0;
};

/**
 * Random-access reader over one local file
 * read_at may be called from several part workers at once
 */
class IInputFile {
public:
  virtual ~IInputFile() = default;

  /**
   * Read exactly size bytes at offset
   * @return false on a short read or I/O error
   */
  virtual bool read_at(uint64_t offset, uint64_t size, Bytes& out) = 0;
};

/**
 * Sequential writer over one local file
 */
class IOutputFile {
public:
  virtual ~IOutputFile() = default;

  virtual bool write(const Bytes& data) = 0;

  /**
   * Flush and close. Returns false if any earlier write was lost.
   */
  virtual bool close() = 0;
};

/**
 * Opens local files
 * Both methods return nullptr when the file cannot be opened
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  virtual std::unique_ptr<IInputFile> open_input(const std::string& path) = 0;

  virtual std::unique_ptr<IOutputFile> open_output(const std::string& path) = 0;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_LOCAL_IO_INTERFACES_HPP
