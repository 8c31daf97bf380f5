// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "key_normalizer.hpp"

#include "transfer_error.hpp"

namespace porter {
namespace transfer {

namespace {

bool isContinuationByte(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

std::string KeyNormalizer::normalize(const std::string& raw) {
  std::string out;
  out.reserve(raw.size());

  for (char ch : raw) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (c == '\\') {
      c = '/';
    }
    if (c < 0x20) {
      continue;
    }
    if (c == '/' && (out.empty() || out.back() == '/')) {
      // Drops the leading slash and collapses runs.
      continue;
    }
    out.push_back(static_cast<char>(c));
  }

  if (out.size() > kMaxKeyBytes) {
    size_t cut = kMaxKeyBytes;
    // Back off to the lead byte if the cut lands inside a multi-byte sequence.
    while (cut > 0 && isContinuationByte(static_cast<unsigned char>(out[cut]))) {
      --cut;
    }
    out.resize(cut);
  }
  return out;
}

bool KeyNormalizer::validate(const std::string& key) {
  if (key.empty() || key.size() > kMaxKeyBytes) {
    return false;
  }
  for (char ch : key) {
    switch (static_cast<unsigned char>(ch)) {
      case 0x00:
      case 0x08:
      case 0x0B:
      case 0x0C:
      case 0x0E:
      case 0x1F:
        return false;
      default:
        break;
    }
  }
  return true;
}

ObjectKey ObjectKey::parse(const std::string& raw) {
  std::string normalized = KeyNormalizer::normalize(raw);
  if (!KeyNormalizer::validate(normalized)) {
    throw TransferError(ErrorKind::InvalidKey, "normalize_key", "invalid object key '" + raw + "'");
  }
  return ObjectKey(std::move(normalized));
}

}  // namespace transfer
}  // namespace porter
