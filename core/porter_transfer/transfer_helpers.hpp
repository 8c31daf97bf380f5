// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_TRANSFER_HELPERS_HPP
#define PORTER_TRANSFER_HELPERS_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {

constexpr const char* kDefaultContentType = "application/octet-stream";

/**
 * Content type for a key or path from its extension (case-insensitive).
 * Unknown or missing extensions give application/octet-stream.
 */
std::string detectContentType(const std::string& key);

/**
 * Human readable size with two decimals: "0 B", "512.00 B", "1.50 MB".
 */
std::string formatFileSize(uint64_t bytes);

/**
 * "MM:SS", or "HH:MM:SS" from one hour up. Negative input counts as 0.
 */
std::string formatEta(double seconds);

/**
 * Strip a leading "x-amz-meta-" (any case) from every metadata key; the
 * store adds it back on the wire.
 */
Metadata normalizeMetadataKeys(const Metadata& metadata);

/**
 * Strip surrounding double quotes from an ETag.
 */
std::string stripEtagQuotes(const std::string& etag);

/**
 * ISO-8601 UTC with seconds precision: "2026-01-31T12:00:00Z".
 */
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_TRANSFER_HELPERS_HPP
