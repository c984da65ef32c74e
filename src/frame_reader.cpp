#include "frame_reader.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <utility>

namespace ut325f {

using std::chrono::milliseconds;

const char* readStatusToString(ReadStatus status) {
  switch (status) {
    case ReadStatus::Ok:             return "OK";
    case ReadStatus::SyncTimeout:    return "Timeout reading sync header";
    case ReadStatus::PayloadTimeout: return "Timeout reading data";
    case ReadStatus::IoError:        return "Serial read error";
    case ReadStatus::NotOpen:        return "Serial port is not open";
    case ReadStatus::Decode:         return "Invalid frame";
    default:                         return "Unknown read error";
  }
}

FrameReader::FrameReader(std::unique_ptr<MeterSession> session)
  : FrameReader(std::move(session), Deadlines()) {}

FrameReader::FrameReader(std::unique_ptr<MeterSession> session, const Deadlines& deadlines)
  : _session(std::move(session)), _deadlines(deadlines) {}

ReadStatus FrameReader::readFrame(Reading& out) {
  _lastDecodeError = frame::DecodeError::None;

  if (!_session || !_session->isOpen() || _session->timer() == nullptr) {
    return finish(ReadStatus::NotOpen);
  }

  std::array<uint8_t, frame::FRAME_SIZE> buf;

  ReadStatus status = synchronize(buf.data());
  if (status != ReadStatus::Ok) {
    return finish(status);
  }

  status = readPayload(buf.data() + frame::SYNC_SIZE);
  if (status != ReadStatus::Ok) {
    return finish(status);
  }

  frame::DecodeError err = frame::decode(buf.data(), buf.size(), out);
  if (err != frame::DecodeError::None) {
    _lastDecodeError = err;
    return finish(ReadStatus::Decode);
  }

  return finish(ReadStatus::Ok);
}

// Slide a SYNC_SIZE window over the stream one byte at a time until it
// holds the marker, so a marker straddling any read boundary is found.
ReadStatus FrameReader::synchronize(uint8_t* window) {
  HAL::ITimer* timer = _session->timer();
  const int64_t deadline = timer->getUptimeMs() + _deadlines.sync.count();
  size_t filled = 0;
  uint64_t slipped = 0;

  while (true) {
    if (filled == frame::SYNC_SIZE) {
      if (std::equal(frame::SYNC.begin(), frame::SYNC.end(), window)) {
        if (slipped > 0) {
          UT325F_LOG_DEBUG("Resynchronized after %llu bytes",
                           static_cast<unsigned long long>(slipped));
        }
        return ReadStatus::Ok;
      }
      std::memmove(window, window + 1, frame::SYNC_SIZE - 1);
      filled = frame::SYNC_SIZE - 1;
      slipped++;
      _stats.discardedBytes++;
    }

    int64_t remaining = deadline - timer->getUptimeMs();
    if (remaining <= 0) {
      return ReadStatus::SyncTimeout;
    }

    size_t n = 0;
    HAL::IoStatus io = _session->readExact(window + filled, frame::SYNC_SIZE - filled, n,
                                           milliseconds(remaining));
    filled += n;
    if (io != HAL::IoStatus::Ok && io != HAL::IoStatus::Timeout) {
      return ReadStatus::IoError;
    }
  }
}

ReadStatus FrameReader::readPayload(uint8_t* dest) {
  HAL::ITimer* timer = _session->timer();
  const int64_t deadline = timer->getUptimeMs() + _deadlines.payload.count();
  size_t got = 0;

  while (got < frame::PAYLOAD_SIZE) {
    int64_t remaining = deadline - timer->getUptimeMs();
    if (remaining <= 0) {
      return ReadStatus::PayloadTimeout;
    }

    size_t n = 0;
    HAL::IoStatus io = _session->readExact(dest + got, frame::PAYLOAD_SIZE - got, n,
                                           milliseconds(remaining));
    got += n;
    if (io != HAL::IoStatus::Ok && io != HAL::IoStatus::Timeout) {
      return ReadStatus::IoError;
    }
  }
  return ReadStatus::Ok;
}

ReadStatus FrameReader::finish(ReadStatus status) {
  _lastStatus = status;
  switch (status) {
    case ReadStatus::Ok:             _stats.frames++; break;
    case ReadStatus::SyncTimeout:    _stats.syncTimeouts++; break;
    case ReadStatus::PayloadTimeout: _stats.payloadTimeouts++; break;
    case ReadStatus::IoError:
    case ReadStatus::NotOpen:        _stats.ioErrors++; break;
    case ReadStatus::Decode:         _stats.decodeErrors++; break;
  }
  return status;
}

std::string FrameReader::lastErrorText() const {
  if (_lastStatus == ReadStatus::Decode) {
    return frame::decodeErrorToString(_lastDecodeError);
  }
  return readStatusToString(_lastStatus);
}

} // namespace ut325f
