#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace cadence::model {

enum class Direction : std::uint8_t {
  kSent     = 1,
  kReceived = 2,
};

// Exact, case-preserving match of "sent" / "received".
constexpr std::optional<Direction> ParseDirection(std::string_view value) {
  if (value == "sent") {
    return Direction::kSent;
  }
  if (value == "received") {
    return Direction::kReceived;
  }
  return std::nullopt;
}

constexpr std::string_view ToString(Direction direction) {
  switch (direction) {
    case Direction::kSent:
      return "sent";
    case Direction::kReceived:
      return "received";
  }
  return "unknown";
}

/*
  One communication event. Immutable once loaded; identity is the position
  in the owning RecordTable.
*/
struct Record {
  cadence::util::TimePoint timestamp;
  std::string              counterparty;
  Direction                direction{Direction::kSent};
};

} // namespace cadence::model
