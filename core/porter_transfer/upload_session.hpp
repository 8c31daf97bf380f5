// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef PORTER_UPLOAD_SESSION_HPP
#define PORTER_UPLOAD_SESSION_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "transfer_types.hpp"

namespace porter {
namespace transfer {

/**
 * Multipart session lifecycle.
 *
 * State transitions:
 * - Initiated -> PartsUploading: part workers start
 * - PartsUploading -> Completing: every part uploaded
 * - Completing -> Completed: the store assembled the object
 * - PartsUploading/Completing -> Aborted: any failure
 */
enum class SessionState { Initiated, PartsUploading, Completing, Completed, Aborted };

std::string sessionStateToString(SessionState state);

/**
 * Byte range of one part: [offset, offset + length).
 */
struct PartRange {
  int part_number = 0;
  uint64_t offset = 0;
  uint64_t length = 0;
};

/**
 * One multipart upload, owned by the engine call that created it.
 *
 * Parts may be recorded from several worker threads.
 */
class UploadSession {
public:
  UploadSession(std::string upload_id, std::string key, uint64_t total_size, uint64_t chunk_size);

  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  /**
   * ceil(total_size / chunk_size); 0 when chunk_size is 0.
   */
  static int partCount(uint64_t total_size, uint64_t chunk_size);

  /**
   * Range of the part at part_index (0-based). Part numbers start at 1.
   */
  PartRange partRange(int part_index) const;

  void recordPart(int part_number, const std::string& etag);

  /**
   * Parts sorted by part number, ready for completion.
   *
   * @throws TransferError (MultipartFailure) unless exactly totalParts()
   *         parts numbered 1..N are recorded
   */
  std::vector<CompletedPart> completedParts() const;

  SessionState state() const;

  bool isValidTransition(SessionState from, SessionState to) const;

  /**
   * @param to Target state
   * @param error_msg Set when the transition is rejected
   * @return true if the state changed
   */
  bool transitionTo(SessionState to, std::string& error_msg);

  const std::string& uploadId() const {
    return upload_id_;
  }

  const std::string& key() const {
    return key_;
  }

  uint64_t totalSize() const {
    return total_size_;
  }

  uint64_t chunkSize() const {
    return chunk_size_;
  }

  int totalParts() const {
    return total_parts_;
  }

private:
  std::string upload_id_;
  std::string key_;
  uint64_t total_size_;
  uint64_t chunk_size_;
  int total_parts_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::Initiated;
  std::vector<CompletedPart> parts_;
};

}  // namespace transfer
}  // namespace porter

#endif  // PORTER_UPLOAD_SESSION_HPP
