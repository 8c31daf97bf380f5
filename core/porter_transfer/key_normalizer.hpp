// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_KEY_NORMALIZER_HPP
#define PORTER_KEY_NORMALIZER_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>

namespace porter {
namespace transfer {

/**
 * Object key rules for S3-style stores.
 *
 * Normalization:
 *   1. backslashes become forward slashes
 *   2. bytes below 0x20 are removed
 *   3. runs of slashes collapse to one
 *   4. one leading slash is stripped
 *   5. the result is cut to 1024 bytes without splitting a UTF-8 sequence
 *
 * normalize() is idempotent.
 */
class KeyNormalizer {
public:
  static constexpr size_t kMaxKeyBytes = 1024;

  static std::string normalize(const std::string& raw);

  /**
   * False for empty keys, keys longer than 1024 bytes and keys containing
   * any of 0x00, 0x08, 0x0B, 0x0C, 0x0E or 0x1F.
   */
  static bool validate(const std::string& key);

  /**
   * Normalize a list prefix. An empty prefix stays empty.
   */
  static std::string sanitizePrefix(const std::string& raw) {
    return normalize(raw);
  }
};

/**
 * A normalized, validated object key.
 */
class ObjectKey {
public:
  /**
   * Normalize and validate raw.
   *
   * @throws TransferError with kind InvalidKey if the normalized key is invalid
   */
  static ObjectKey parse(const std::string& raw);

  const std::string& str() const {
    return value_;
  }

  bool operator==(const ObjectKey& other) const {
    return value_ == other.value_;
  }

  bool operator!=(const ObjectKey& other) const {
    return value_ != other.value_;
  }

private:
  explicit ObjectKey(std::string value)
      : value_(std::move(value)) {}

  std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const ObjectKey& key) {
  return os << key.str();
}

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_KEY_NORMALIZER_HPP
