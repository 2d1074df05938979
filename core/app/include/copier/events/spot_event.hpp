#pragma once

#include "copier/domain/types.hpp"

namespace copier {

struct SpotEvent {
  domain::AccountId account_id{0};
  domain::InstrumentId instrument_id{0};
  double bid{0.0};
  double ask{0.0};
};

}  // namespace copier
