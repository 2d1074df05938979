#pragma once

#include "copier/domain/types.hpp"

#include <map>
#include <optional>
#include <variant>

namespace copier {

// -----------------------------------------------------------------------------
// Volume sizing policies
// -----------------------------------------------------------------------------
// Closed set of sizing strategies. Exactly one is active; configuration picks
// it (see buildVolumePolicy in copier_config.hpp) and VolumeCalculator
// evaluates it.
// -----------------------------------------------------------------------------

// slave = master * multiplier
struct GlobalMultiplier {
  double multiplier{1.0};
};

// slave = master * multipliers[instrument], default_multiplier when absent
struct InstrumentMultiplierTable {
  std::map<domain::InstrumentId, double> multipliers;
  double default_multiplier{0.5};
};

// slave = balance * lot_percentage * micro_lots_per_dollar / 100, in lots
struct BalancePercentage {
  double lot_percentage{0.02};
  double micro_lots_per_dollar{10.0};
  std::map<domain::InstrumentId, double> micro_lots_per_dollar_overrides;
  double fallback_multiplier{0.5};  // Used when no balance is available
};

// slave = master * master_pip_value / slave_pip_value * target_risk_ratio
struct PipEqualization {
  double target_risk_ratio{1.0};
  double fallback_multiplier{0.5};  // Used when pip data is missing
};

using VolumePolicy = std::variant<GlobalMultiplier, InstrumentMultiplierTable,
                                  BalancePercentage, PipEqualization>;

// Post-processing bounds applied after every policy.
struct VolumeLimits {
  domain::Volume min_lot_size{0.01};
  double max_lot_multiplier{2.0};
};

// Account-side inputs for one sizing call. Fields a policy does not need may
// stay empty.
struct AccountSnapshot {
  std::optional<double> slave_balance;
  std::optional<double> master_pip_value;
  std::optional<double> slave_pip_value;
  domain::Volume lot_step{0.01};
};

inline const char* policyName(const VolumePolicy& policy) {
  if (std::holds_alternative<GlobalMultiplier>(policy)) {
    return "global_multiplier";
  }
  if (std::holds_alternative<InstrumentMultiplierTable>(policy)) {
    return "instrument_multiplier_table";
  }
  if (std::holds_alternative<BalancePercentage>(policy)) {
    return "balance_percentage";
  }
  return "pip_equalization";
}

}  // namespace copier
