// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for transfer helper functions
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "remote_store.hpp"
#include "transfer_helpers.hpp"

using namespace porter::transfer;

TEST(DetectContentTypeTest, KnownExtensions) {
  EXPECT_EQ(detectContentType("notes.txt"), "text/plain");
  EXPECT_EQ(detectContentType("data/config.json"), "application/json");
  EXPECT_EQ(detectContentType("img/logo.png"), "image/png");
  EXPECT_EQ(detectContentType("docs/report.pdf"), "application/pdf");
  EXPECT_EQ(detectContentType("photo.jpeg"), "image/jpeg");
}

TEST(DetectContentTypeTest, CaseInsensitive) {
  EXPECT_EQ(detectContentType("PHOTO.JPG"), "image/jpeg");
  EXPECT_EQ(detectContentType("Index.Html"), "text/html");
}

TEST(DetectContentTypeTest, FallsBackToOctetStream) {
  EXPECT_EQ(detectContentType("Makefile"), kDefaultContentType);
  EXPECT_EQ(detectContentType("archive.unknownext"), kDefaultContentType);
  EXPECT_EQ(detectContentType("dir.d/file"), kDefaultContentType);
  EXPECT_EQ(detectContentType("trailing."), kDefaultContentType);
  EXPECT_EQ(detectContentType(""), kDefaultContentType);
}

TEST(FormatFileSizeTest, Units) {
  EXPECT_EQ(formatFileSize(0), "0 B");
  EXPECT_EQ(formatFileSize(512), "512.00 B");
  EXPECT_EQ(formatFileSize(1024), "1.00 KB");
  EXPECT_EQ(formatFileSize(1536 * 1024), "1.50 MB");
  EXPECT_EQ(formatFileSize(5ULL * 1024 * 1024 * 1024), "5.00 GB");
  EXPECT_EQ(formatFileSize(2048ULL * 1024 * 1024 * 1024 * 1024), "2048.00 TB");
}

TEST(FormatEtaTest, MinutesAndHours) {
  EXPECT_EQ(formatEta(0), "00:00");
  EXPECT_EQ(formatEta(65.9), "01:05");
  EXPECT_EQ(formatEta(3599), "59:59");
  EXPECT_EQ(formatEta(3661), "01:01:01");
  EXPECT_EQ(formatEta(-5), "00:00");
}

TEST(NormalizeMetadataKeysTest, StripsAmzPrefix) {
  const Metadata input = {
    {"x-amz-meta-owner", "alice"},
    {"X-Amz-Meta-Project", "porter"},
    {"plain", "value"},
  };
  const Metadata expected = {
    {"owner", "alice"},
    {"Project", "porter"},
    {"plain", "value"},
  };
  EXPECT_EQ(normalizeMetadataKeys(input), expected);
}

TEST(StripEtagQuotesTest, Quotes) {
  EXPECT_EQ(stripEtagQuotes("\"abc123\""), "abc123");
  EXPECT_EQ(stripEtagQuotes("abc123"), "abc123");
  EXPECT_EQ(stripEtagQuotes("\""), "\"");
  EXPECT_EQ(stripEtagQuotes(""), "");
}

TEST(FormatTimestampTest, Utc) {
  EXPECT_EQ(formatTimestamp(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00Z");
  EXPECT_EQ(
    formatTimestamp(std::chrono::system_clock::time_point{} + std::chrono::seconds(86400 + 3723)),
    "1970-01-02T01:02:03Z"
  );
}

TEST(UploadTypeNameTest, Names) {
  EXPECT_STREQ(uploadTypeName(UploadType::Simple), "simple");
  EXPECT_STREQ(uploadTypeName(UploadType::Multipart), "multipart");
  EXPECT_STREQ(uploadTypeName(UploadType::Stream), "stream");
}

TEST(ByteRangeTest, Header) {
  EXPECT_EQ((ByteRange{0, 99}).header(), "bytes=0-99");
  EXPECT_EQ((ByteRange{100, std::nullopt}).header(), "bytes=100-");
}
