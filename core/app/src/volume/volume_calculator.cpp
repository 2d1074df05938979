#include "copier/volume/volume_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace copier {

namespace {

// Rounds away binary noise such as 0.030000000000000002 so equal volumes
// compare equal after arithmetic.
double clean(double volume) { return std::round(volume * 1e8) / 1e8; }

double multiplierFor(const InstrumentMultiplierTable& table,
                     domain::InstrumentId instrument_id) {
  auto it = table.multipliers.find(instrument_id);
  return it != table.multipliers.end() ? it->second
                                       : table.default_multiplier;
}

}  // namespace

VolumeCalculator::VolumeCalculator(VolumePolicy policy, VolumeLimits limits)
    : policy_(std::move(policy)), limits_(limits) {}

VolumeResult VolumeCalculator::compute(domain::InstrumentId instrument_id,
                                       domain::Volume master_volume,
                                       const AccountSnapshot& snapshot) const {
  return compute(instrument_id, master_volume, policy_, snapshot, limits_);
}

// -----------------------------------------------------------------------------
// compute(): evaluate the policy, then post-process
// -----------------------------------------------------------------------------
VolumeResult VolumeCalculator::compute(domain::InstrumentId instrument_id,
                                       domain::Volume master_volume,
                                       const VolumePolicy& policy,
                                       const AccountSnapshot& snapshot,
                                       const VolumeLimits& limits) {
  VolumeResult result;

  if (const auto* p = std::get_if<GlobalMultiplier>(&policy)) {
    result.raw_volume = master_volume * p->multiplier;
  } else if (const auto* p = std::get_if<InstrumentMultiplierTable>(&policy)) {
    result.raw_volume = master_volume * multiplierFor(*p, instrument_id);
  } else if (const auto* p = std::get_if<BalancePercentage>(&policy)) {
    if (snapshot.slave_balance && *snapshot.slave_balance > 0.0) {
      auto it = p->micro_lots_per_dollar_overrides.find(instrument_id);
      const double micro_lots_per_dollar =
          it != p->micro_lots_per_dollar_overrides.end()
              ? it->second
              : p->micro_lots_per_dollar;
      const double risk_amount = *snapshot.slave_balance * p->lot_percentage;
      result.raw_volume =
          risk_amount * micro_lots_per_dollar / domain::kMicroLotsPerLot;
    } else {
      result.raw_volume = master_volume * p->fallback_multiplier;
      result.fallback_used = true;
    }
  } else if (const auto* p = std::get_if<PipEqualization>(&policy)) {
    if (snapshot.master_pip_value && snapshot.slave_pip_value &&
        *snapshot.master_pip_value > 0.0 && *snapshot.slave_pip_value > 0.0) {
      result.raw_volume = master_volume * (*snapshot.master_pip_value /
                                           *snapshot.slave_pip_value) *
                          p->target_risk_ratio;
    } else {
      result.raw_volume = master_volume * p->fallback_multiplier;
      result.fallback_used = true;
    }
  }

  if (result.fallback_used) {
    result.warning = ErrorKind::PolicyFallback;
  }

  result.slave_volume =
      postProcess(result.raw_volume, master_volume, limits, snapshot.lot_step,
                  &result.clamped_to_min, &result.capped);
  return result;
}

// -----------------------------------------------------------------------------
// postProcess(): min clamp -> max cap -> lot-step rounding
// -----------------------------------------------------------------------------
domain::Volume VolumeCalculator::postProcess(domain::Volume raw,
                                             domain::Volume master_volume,
                                             const VolumeLimits& limits,
                                             domain::Volume lot_step,
                                             bool* clamped_to_min,
                                             bool* capped) {
  domain::Volume volume = raw;

  if (volume < limits.min_lot_size - domain::kVolumeEpsilon) {
    volume = limits.min_lot_size;
    if (clamped_to_min != nullptr) {
      *clamped_to_min = true;
    }
  }

  const domain::Volume ceiling = limits.max_lot_multiplier * master_volume;
  if (limits.max_lot_multiplier > 0.0 &&
      volume > ceiling + domain::kVolumeEpsilon) {
    volume = ceiling;
    if (capped != nullptr) {
      *capped = true;
    }
  }

  return roundToStep(volume, lot_step);
}

domain::Volume VolumeCalculator::roundToStep(domain::Volume volume,
                                             domain::Volume step) {
  if (step <= 0.0) {
    return clean(volume);
  }
  const double steps = std::round(volume / step);
  return clean(std::max(steps, 1.0) * step);
}

domain::Volume VolumeCalculator::floorToStep(domain::Volume volume,
                                             domain::Volume step) {
  if (step <= 0.0) {
    return clean(volume);
  }
  // The epsilon keeps 0.02/0.01 = 1.9999999 from flooring to 1.
  const double steps = std::floor(volume / step + 1e-6);
  return clean(std::max(steps, 0.0) * step);
}

bool VolumeCalculator::needsBalance() const {
  return std::holds_alternative<BalancePercentage>(policy_);
}

bool VolumeCalculator::needsPipValues() const {
  return std::holds_alternative<PipEqualization>(policy_);
}

}  // namespace copier
