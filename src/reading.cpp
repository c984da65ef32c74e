#include "reading.hpp"

namespace ut325f {

bool holdTypeFromCode(uint8_t code, HoldType& out) {
  switch (code) {
    case 0: out = HoldType::CURRENT; return true;
    case 1: out = HoldType::MAXIMUM; return true;
    case 2: out = HoldType::MINIMUM; return true;
    case 3: out = HoldType::AVERAGE; return true;
    default: return false;
  }
}

const char* holdTypeToString(HoldType type) {
  switch (type) {
    case HoldType::CURRENT: return "Current";
    case HoldType::MAXIMUM: return "Maximum";
    case HoldType::MINIMUM: return "Minimum";
    case HoldType::AVERAGE: return "Average";
    default: return "Current";
  }
}

} // namespace ut325f
