#pragma once

#include "copier/domain/types.hpp"

#include <optional>
#include <string>

namespace copier {
namespace domain {

// Static trading properties of one instrument on one broker.
struct InstrumentSpec {
  InstrumentId instrument_id{0};
  std::string name;
  int digits{5};
  int pip_position{4};             // pip size = 10^-pip_position
  double lot_size{100000.0};       // Units of base asset per lot
  Volume lot_step{0.01};           // Smallest tradeable volume increment
  bool quote_is_deposit{true};     // Quote currency equals account currency
};

}  // namespace domain
}  // namespace copier
