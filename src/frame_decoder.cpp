#include "frame_decoder.hpp"
#include <cmath>
#include <cstring>
#include <limits>

namespace ut325f::frame {

namespace {

// Little-endian field reader over a fixed buffer
class Cursor {
public:
  Cursor(const uint8_t* data, size_t len) : data(data), len(len) {}

  size_t offset() const { return pos; }

  bool skip(size_t n) {
    if (pos + n > len) return false;
    pos += n;
    return true;
  }

  bool u8(uint8_t& out) {
    if (pos + 1 > len) return false;
    out = data[pos++];
    return true;
  }

  bool u16(uint16_t& out) {
    if (pos + 2 > len) return false;
    out = static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
    pos += 2;
    return true;
  }

  bool u32(uint32_t& out) {
    if (pos + 4 > len) return false;
    out = static_cast<uint32_t>(data[pos]) |
          (static_cast<uint32_t>(data[pos + 1]) << 8) |
          (static_cast<uint32_t>(data[pos + 2]) << 16) |
          (static_cast<uint32_t>(data[pos + 3]) << 24);
    pos += 4;
    return true;
  }

  bool f32(float& out) {
    uint32_t bits;
    if (!u32(bits)) return false;
    static_assert(sizeof(float) == sizeof(uint32_t));
    std::memcpy(&out, &bits, sizeof(out));
    return true;
  }

private:
  const uint8_t* data;
  size_t len;
  size_t pos = 0;
};

// Values first, then one error flag per channel; a set flag wins over the value
bool readChannels(Cursor& cur, std::array<float, Reading::NUM_CHANNELS>& temps) {
  for (auto& t : temps) {
    if (!cur.f32(t)) return false;
  }
  for (auto& t : temps) {
    uint8_t flag;
    if (!cur.u8(flag)) return false;
    if (flag != 0) {
      t = std::numeric_limits<float>::quiet_NaN();
    }
  }
  return true;
}

} // namespace

const char* decodeErrorToString(DecodeError error) {
  switch (error) {
    case DecodeError::None:            return "OK";
    case DecodeError::WrongSize:       return "Incorrect buffer size";
    case DecodeError::BadSync:         return "Bad sync header";
    case DecodeError::InvalidHoldType: return "Invalid HoldType";
    case DecodeError::IncompleteParse: return "Failed to parse all bytes";
    default:                           return "Unknown decode error";
  }
}

DecodeError decode(const uint8_t* data, size_t len,
                   std::chrono::system_clock::time_point captureTime, Reading& out) {
  if (data == nullptr || len != FRAME_SIZE) {
    return DecodeError::WrongSize;
  }
  if (std::memcmp(data, SYNC.data(), SYNC_SIZE) != 0) {
    return DecodeError::BadSync;
  }

  Cursor cur(data, len);
  if (!cur.skip(SYNC_SIZE)) return DecodeError::IncompleteParse;

  Reading r;
  if (!readChannels(cur, r.currentTemps)) return DecodeError::IncompleteParse;
  if (!readChannels(cur, r.heldTemps)) return DecodeError::IncompleteParse;
  if (!cur.f32(r.meterTemp)) return DecodeError::IncompleteParse;

  uint32_t unknown;
  if (!cur.u32(unknown)) return DecodeError::IncompleteParse;

  uint8_t holdCode;
  if (!cur.u8(holdCode)) return DecodeError::IncompleteParse;
  if (!holdTypeFromCode(holdCode, r.holdType)) {
    return DecodeError::InvalidHoldType;
  }

  // Possibly a checksum; the algorithm is unknown so it is not checked
  uint16_t trailer;
  if (!cur.u16(trailer)) return DecodeError::IncompleteParse;

  r.captureTime = captureTime;

  if (cur.offset() != FRAME_SIZE) {
    return DecodeError::IncompleteParse;
  }

  out = r;
  return DecodeError::None;
}

DecodeError decode(const uint8_t* data, size_t len, Reading& out) {
  return decode(data, len, std::chrono::system_clock::now(), out);
}

} // namespace ut325f::frame
