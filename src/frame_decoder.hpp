/*
 * UT325F frame decoder
 * Pure conversion of one 56-byte device frame into a Reading
 */

#pragma once

#include "reading.hpp"
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace ut325f::frame {

static constexpr size_t FRAME_SIZE = 56;
static constexpr size_t SYNC_SIZE = 5;
static constexpr size_t PAYLOAD_SIZE = FRAME_SIZE - SYNC_SIZE;
static constexpr std::array<uint8_t, SYNC_SIZE> SYNC = {0xAA, 0x55, 0x00, 0x34, 0x01};

// Byte offset of the hold-type code within a frame
static constexpr size_t HOLD_TYPE_OFFSET = 53;

enum class DecodeError {
  None,
  WrongSize,        // buffer is not FRAME_SIZE bytes
  BadSync,          // first SYNC_SIZE bytes are not the marker
  InvalidHoldType,  // hold-type code outside 0..3
  IncompleteParse   // cursor did not land exactly on FRAME_SIZE
};

const char* decodeErrorToString(DecodeError error);

/**
 * @brief Decode a frame, stamping the reading with the given capture time.
 *
 * @param data Frame bytes
 * @param len Number of bytes in data
 * @param out Filled only on success
 * @return DecodeError::None on success
 */
DecodeError decode(const uint8_t* data, size_t len,
                   std::chrono::system_clock::time_point captureTime, Reading& out);

/**
 * @brief Decode a frame, stamping the reading with the current wall-clock time.
 */
DecodeError decode(const uint8_t* data, size_t len, Reading& out);

} // namespace ut325f::frame
