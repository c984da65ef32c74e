#pragma once

#include "frame_reader.hpp"
#include "reading.hpp"
#include <string>

namespace ut325f {

/**
 * @brief "<unix time> <t1> <t2> <t3> <t4>" with the current temperatures.
 */
std::string formatCurrent(const Reading& reading);

/**
 * @brief Current temperatures followed by the hold type and held temperatures.
 */
std::string formatAll(const Reading& reading);

/**
 * @brief Serialize a reading to a JSON object. Sensor errors become null.
 */
std::string toJson(const Reading& reading);

std::string statsToJson(const ReaderStats& stats);

std::string escapeJson(const std::string& str);

} // namespace ut325f
