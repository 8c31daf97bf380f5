// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_session.hpp"

#include <algorithm>
#include <utility>

#include "transfer_error.hpp"

namespace porter {
namespace transfer {

std::string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::Initiated:
      return "initiated";
    case SessionState::PartsUploading:
      return "parts_uploading";
    case SessionState::Completing:
      return "completing";
    case SessionState::Completed:
      return "completed";
    case SessionState::Aborted:
      return "aborted";
  }
  return "unknown";
}

UploadSession::UploadSession(
  std::string upload_id, std::string key, uint64_t total_size, uint64_t chunk_size
)
    : upload_id_(std::move(upload_id))
    , key_(std::move(key))
    , total_size_(total_size)
    , chunk_size_(chunk_size)
    , total_parts_(partCount(total_size, chunk_size)) {
  parts_.reserve(static_cast<size_t>(total_parts_));
}

int UploadSession::partCount(uint64_t total_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    return 0;
  }
  return static_cast<int>((total_size + chunk_size - 1) / chunk_size);
}

PartRange UploadSession::partRange(int part_index) const {
  PartRange range;
  range.part_number = part_index + 1;
  range.offset = static_cast<uint64_t>(part_index) * chunk_size_;
  const uint64_t end = std::min(range.offset + chunk_size_, total_size_);
  range.length = end > range.offset ? end - range.offset : 0;
  return range;
}

void UploadSession::recordPart(int part_number, const std::string& etag) {
  std::lock_guard<std::mutex> lock(mutex_);
  parts_.push_back(CompletedPart{part_number, etag});
}

std::vector<CompletedPart> UploadSession::completedParts() const {
  std::vector<CompletedPart> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted = parts_;
  }
  std::sort(sorted.begin(), sorted.end(), [](const CompletedPart& a, const CompletedPart& b) {
    return a.part_number < b.part_number;
  });

  if (sorted.size() != static_cast<size_t>(total_parts_)) {
    throw TransferError(
      ErrorKind::MultipartFailure, "complete_multipart_upload",
      "expected " + std::to_string(total_parts_) + " parts, have " +
        std::to_string(sorted.size())
    );
  }
  for (size_t i = 0; i < sorted.size(); ++i) {
    if (sorted[i].part_number != static_cast<int>(i) + 1) {
      throw TransferError(
        ErrorKind::MultipartFailure, "complete_multipart_upload",
        "part sequence broken at position " + std::to_string(i + 1) + " (part " +
          std::to_string(sorted[i].part_number) + ")"
      );
    }
  }
  return sorted;
}

SessionState UploadSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool UploadSession::isValidTransition(SessionState from, SessionState to) const {
  switch (from) {
    case SessionState::Initiated:
      return to == SessionState::PartsUploading;
    case SessionState::PartsUploading:
      return to == SessionState::Completing || to == SessionState::Aborted;
    case SessionState::Completing:
      return to == SessionState::Completed || to == SessionState::Aborted;
    case SessionState::Completed:
    case SessionState::Aborted:
      return false;
  }
  return false;
}

bool UploadSession::transitionTo(SessionState to, std::string& error_msg) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!isValidTransition(state_, to)) {
    error_msg = "invalid session transition " + sessionStateToString(state_) + " -> " +
                sessionStateToString(to);
    return false;
  }
  state_ = to;
  return true;
}

}  // namespace transfer
}  // namespace porter
