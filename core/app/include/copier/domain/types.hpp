#pragma once

#include <cstdint>

namespace copier {
namespace domain {

// Broker-assigned identifiers. The venue uses signed 64-bit ids throughout.
using AccountId = std::int64_t;
using PositionId = std::int64_t;
using InstrumentId = std::int64_t;

// Volumes are expressed in lots (1 lot = 100 micro-lots).
using Volume = double;

inline constexpr double kMicroLotsPerLot = 100.0;

// Tolerance used when comparing lot volumes that went through arithmetic.
inline constexpr double kVolumeEpsilon = 1e-9;

enum class Side { Long, Short };

// Which side of the copy relationship a catalog or position belongs to.
enum class Broker { Master, Slave };

enum class Environment { Demo, Live };

inline const char* toString(Side side) {
  switch (side) {
    case Side::Long:  return "LONG";
    case Side::Short: return "SHORT";
  }
  return "UNKNOWN";
}

inline Side opposite(Side side) {
  return side == Side::Long ? Side::Short : Side::Long;
}

inline const char* toString(Broker broker) {
  switch (broker) {
    case Broker::Master: return "master";
    case Broker::Slave:  return "slave";
  }
  return "unknown";
}

inline const char* toString(Environment env) {
  switch (env) {
    case Environment::Demo: return "demo";
    case Environment::Live: return "live";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace copier
