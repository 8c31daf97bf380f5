// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for KeyNormalizer and ObjectKey
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "key_normalizer.hpp"
#include "transfer_error.hpp"

using namespace porter::transfer;

TEST(KeyNormalizerTest, CollapsesSlashesAndStripsLeadingSlash) {
  EXPECT_EQ(KeyNormalizer::normalize("/folder//file.txt"), "folder/file.txt");
  EXPECT_EQ(KeyNormalizer::normalize("///a///b"), "a/b");
  EXPECT_EQ(KeyNormalizer::normalize("plain.txt"), "plain.txt");
}

TEST(KeyNormalizerTest, KeepsTrailingSlash) {
  EXPECT_EQ(KeyNormalizer::normalize("logs/2026/"), "logs/2026/");
}

TEST(KeyNormalizerTest, ConvertsBackslashes) {
  EXPECT_EQ(KeyNormalizer::normalize("dir\\sub\\file.bin"), "dir/sub/file.bin");
  EXPECT_EQ(KeyNormalizer::normalize("\\\\share\\\\x"), "share/x");
}

TEST(KeyNormalizerTest, RemovesControlCharacters) {
  EXPECT_EQ(KeyNormalizer::normalize("a\tb\nc\r.txt"), "abc.txt");
  EXPECT_EQ(KeyNormalizer::normalize(std::string("a\0b", 3)), "ab");
  EXPECT_EQ(KeyNormalizer::normalize("x\x1f/y"), "x/y");
}

TEST(KeyNormalizerTest, KeepsUtf8AndPrintableCharacters) {
  const std::string key = "r\xC3\xA9sum\xC3\xA9/\xE6\x97\xA5\xE6\x9C\xAC.txt";
  EXPECT_EQ(KeyNormalizer::normalize(key), key);
  EXPECT_EQ(KeyNormalizer::normalize("a b+c=d&e.txt"), "a b+c=d&e.txt");
}

TEST(KeyNormalizerTest, TruncatesLongKeys) {
  const std::string key(2000, 'k');
  const std::string normalized = KeyNormalizer::normalize(key);
  EXPECT_EQ(normalized.size(), KeyNormalizer::kMaxKeyBytes);
}

TEST(KeyNormalizerTest, TruncationDoesNotSplitUtf8Sequence) {
  // 1023 ASCII bytes, then a two-byte sequence straddling the limit.
  const std::string key = std::string(1023, 'a') + "\xC3\xA9" + "tail";
  const std::string normalized = KeyNormalizer::normalize(key);
  EXPECT_EQ(normalized, std::string(1023, 'a'));

  // Three-byte sequence starting at 1022.
  const std::string wide = std::string(1022, 'b') + "\xE6\x97\xA5";
  EXPECT_EQ(KeyNormalizer::normalize(wide), std::string(1022, 'b'));
}

TEST(KeyNormalizerTest, IsIdempotent) {
  const std::vector<std::string> inputs = {
    "/folder//file.txt", "a\\b\\\\c", "//", "", "x\ty", std::string(1500, 'z'),
    std::string(1023, 'a') + "\xC3\xA9", "dir/", "/\\/mixed//\\path",
  };
  for (const auto& input : inputs) {
    const std::string once = KeyNormalizer::normalize(input);
    EXPECT_EQ(KeyNormalizer::normalize(once), once) << "input: " << input;
  }
}

TEST(KeyNormalizerTest, ValidateRejectsEmptyAndOversizedKeys) {
  EXPECT_FALSE(KeyNormalizer::validate(""));
  EXPECT_FALSE(KeyNormalizer::validate(std::string(1025, 'a')));
  EXPECT_TRUE(KeyNormalizer::validate(std::string(1024, 'a')));
}

TEST(KeyNormalizerTest, ValidateRejectsForbiddenBytes) {
  for (char c : {'\x00', '\x08', '\x0B', '\x0C', '\x0E', '\x1F'}) {
    std::string key = "ab";
    key.insert(key.begin() + 1, c);
    EXPECT_FALSE(KeyNormalizer::validate(key)) << "byte " << static_cast<int>(c);
  }
  EXPECT_TRUE(KeyNormalizer::validate("reports/2026/q1.csv"));
}

TEST(KeyNormalizerTest, SanitizePrefixKeepsEmpty) {
  EXPECT_EQ(KeyNormalizer::sanitizePrefix(""), "");
  EXPECT_EQ(KeyNormalizer::sanitizePrefix("/logs//"), "logs/");
}

TEST(ObjectKeyTest, ParseNormalizes) {
  const ObjectKey key = ObjectKey::parse("/a//b.txt");
  EXPECT_EQ(key.str(), "a/b.txt");
  EXPECT_EQ(key, ObjectKey::parse("a/b.txt"));
  EXPECT_NE(key, ObjectKey::parse("a/c.txt"));

  std::ostringstream oss;
  oss << key;
  EXPECT_EQ(oss.str(), "a/b.txt");
}

TEST(ObjectKeyTest, ParseRejectsKeysThatNormalizeToEmpty) {
  for (const std::string raw : {"", "/", "///", "\\\\", "\t\n"}) {
    try {
      ObjectKey::parse(raw);
      FAIL() << "expected InvalidKey for '" << raw << "'";
    } catch (const TransferError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::InvalidKey);
      EXPECT_EQ(e.operation(), "normalize_key");
    }
  }
}
