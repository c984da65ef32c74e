/*
 * UT325F frame reader
 * Recovers whole frames from the meter's byte stream under deadlines
 */

#pragma once

#include "frame_decoder.hpp"
#include "meter_session.hpp"
#include "reading.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ut325f {

enum class ReadStatus {
  Ok,
  SyncTimeout,     // no sync marker found before the sync deadline
  PayloadTimeout,  // marker found, rest of the frame did not arrive in time
  IoError,         // serial read failed for a reason other than timeout
  NotOpen,         // session is not open
  Decode           // frame was read but rejected; see lastDecodeError()
};

const char* readStatusToString(ReadStatus status);

struct ReaderStats {
  uint64_t frames = 0;
  uint64_t syncTimeouts = 0;
  uint64_t payloadTimeouts = 0;
  uint64_t ioErrors = 0;
  uint64_t decodeErrors = 0;
  uint64_t discardedBytes = 0;  // bytes skipped while hunting for sync
};

class FrameReader {
public:
  struct Deadlines {
    std::chrono::milliseconds sync{5000};
    std::chrono::milliseconds payload{5000};
  };

  explicit FrameReader(std::unique_ptr<MeterSession> session);
  FrameReader(std::unique_ptr<MeterSession> session, const Deadlines& deadlines);

  /**
   * @brief Read and decode the next frame from the stream.
   *
   * Each call stands alone: a failed call leaves the stream wherever it
   * stopped consuming and the next call starts a fresh sync hunt.
   *
   * @param out Filled only when ReadStatus::Ok is returned
   */
  ReadStatus readFrame(Reading& out);

  frame::DecodeError lastDecodeError() const { return _lastDecodeError; }

  // Human readable description of the last failed readFrame()
  std::string lastErrorText() const;

  const ReaderStats& stats() const { return _stats; }
  MeterSession& session() { return *_session; }
  const Deadlines& deadlines() const { return _deadlines; }

private:
  std::unique_ptr<MeterSession> _session;
  Deadlines _deadlines;
  ReaderStats _stats;
  ReadStatus _lastStatus = ReadStatus::Ok;
  frame::DecodeError _lastDecodeError = frame::DecodeError::None;

  ReadStatus synchronize(uint8_t* window);
  ReadStatus readPayload(uint8_t* dest);
  ReadStatus finish(ReadStatus status);
};

} // namespace ut325f
