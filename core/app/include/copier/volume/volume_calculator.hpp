#pragma once

#include "copier/domain/errors.hpp"
#include "copier/domain/types.hpp"
#include "copier/volume/volume_policy.hpp"

namespace copier {

// Result of one sizing call, with the post-processing steps that fired.
struct VolumeResult {
  domain::Volume raw_volume{0.0};    // Policy output before post-processing
  domain::Volume slave_volume{0.0};  // Final, tradeable volume
  bool clamped_to_min{false};
  bool capped{false};
  bool fallback_used{false};
  ErrorKind warning{ErrorKind::None};  // PolicyFallback when fallback_used
};

// -----------------------------------------------------------------------------
// VolumeCalculator
// -----------------------------------------------------------------------------
//
// @brief  Maps a master fill volume to the slave order volume.
//
// @details
// compute() evaluates the active VolumePolicy and then always applies the
// same post-processing chain:
//
//   1. raise to VolumeLimits::min_lot_size
//   2. cap at VolumeLimits::max_lot_multiplier * master_volume
//   3. round to the instrument's lot step (never below one step)
//
// The chain is idempotent: feeding its output back in returns the same
// value. Missing balance or pip data is not an error; the policy falls back
// to its fallback multiplier and the result carries PolicyFallback.
//
// Thread model: Stateless after construction; safe from any thread.
// -----------------------------------------------------------------------------
class VolumeCalculator {
 public:
  VolumeCalculator(VolumePolicy policy, VolumeLimits limits);

  VolumeResult compute(domain::InstrumentId instrument_id,
                       domain::Volume master_volume,
                       const AccountSnapshot& snapshot) const;

  // Pure form with every input explicit.
  static VolumeResult compute(domain::InstrumentId instrument_id,
                              domain::Volume master_volume,
                              const VolumePolicy& policy,
                              const AccountSnapshot& snapshot,
                              const VolumeLimits& limits);

  static domain::Volume postProcess(domain::Volume raw,
                                    domain::Volume master_volume,
                                    const VolumeLimits& limits,
                                    domain::Volume lot_step,
                                    bool* clamped_to_min = nullptr,
                                    bool* capped = nullptr);

  // Nearest multiple of step, never less than one step. A non-positive step
  // leaves the volume unchanged.
  static domain::Volume roundToStep(domain::Volume volume,
                                    domain::Volume step);

  // Largest multiple of step not above volume (may be 0).
  static domain::Volume floorToStep(domain::Volume volume,
                                    domain::Volume step);

  bool needsBalance() const;
  bool needsPipValues() const;

  const VolumePolicy& policy() const { return policy_; }
  const VolumeLimits& limits() const { return limits_; }

 private:
  VolumePolicy policy_;
  VolumeLimits limits_;
};

}  // namespace copier
