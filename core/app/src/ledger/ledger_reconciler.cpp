#include "copier/ledger/ledger_reconciler.hpp"
#include "copier/domain/order_request.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace copier {

namespace {

domain::Position makePair(const domain::LivePosition& master,
                          const domain::LivePosition& slave) {
  domain::Position pos;
  pos.instrument_id = master.instrument_id;
  pos.slave_instrument_id = slave.instrument_id;
  pos.master_position_id = master.position_id;
  pos.slave_position_id = slave.position_id;
  pos.side = master.side;
  pos.master_volume = master.volume;
  pos.slave_volume = slave.volume;
  pos.opened_at_ms = master.opened_at_ms;
  return pos;
}

}  // namespace

LedgerReconciler::LedgerReconciler(const SymbolMapper& mapper,
                                   ReconcileSettings settings)
    : mapper_(mapper), settings_(settings) {}

ReconcileResult LedgerReconciler::reconcile(
    const std::vector<domain::LivePosition>& master_positions,
    const std::vector<domain::LivePosition>& slave_positions) const {
  ReconcileResult result;
  std::unordered_set<domain::PositionId> used_slaves;
  std::vector<const domain::LivePosition*> remaining;

  // --- 1) Label pass ---------------------------------------------------------
  std::unordered_map<domain::PositionId, const domain::LivePosition*> by_label;
  for (const auto& slave : slave_positions) {
    if (auto master_id = domain::parseCopyLabel(slave.label)) {
      by_label.emplace(*master_id, &slave);
    }
  }

  for (const auto& master : master_positions) {
    auto it = by_label.find(master.position_id);
    if (it != by_label.end() && used_slaves.count(it->second->position_id) == 0) {
      used_slaves.insert(it->second->position_id);
      result.paired.push_back(makePair(master, *it->second));
      ++result.label_matches;
    } else {
      remaining.push_back(&master);
    }
  }

  // --- 2) Heuristic pass, oldest master first -------------------------------
  std::sort(remaining.begin(), remaining.end(),
            [](const domain::LivePosition* a, const domain::LivePosition* b) {
              return a->opened_at_ms < b->opened_at_ms;
            });

  for (const auto* master : remaining) {
    auto target = mapper_.resolve(master->instrument_id,
                                  domain::Broker::Master,
                                  domain::Broker::Slave);
    const domain::LivePosition* best = nullptr;
    std::int64_t best_dt = std::numeric_limits<std::int64_t>::max();
    double best_ratio_gap = std::numeric_limits<double>::max();

    if (target && master->volume > 0.0) {
      for (const auto& slave : slave_positions) {
        if (used_slaves.count(slave.position_id) != 0 ||
            slave.instrument_id != *target || slave.side != master->side) {
          continue;
        }
        const std::int64_t dt = std::llabs(slave.opened_at_ms - master->opened_at_ms);
        if (dt > settings_.open_time_tolerance_ms) {
          continue;
        }
        const double ratio = slave.volume / master->volume;
        if (ratio <= 0.0 ||
            ratio > settings_.max_volume_ratio + domain::kVolumeEpsilon) {
          continue;
        }
        const double gap = std::abs(ratio - settings_.expected_ratio);
        if (dt < best_dt || (dt == best_dt && gap < best_ratio_gap)) {
          best = &slave;
          best_dt = dt;
          best_ratio_gap = gap;
        }
      }
    }

    if (best != nullptr) {
      used_slaves.insert(best->position_id);
      result.paired.push_back(makePair(*master, *best));
    } else {
      result.unpaired_master.push_back(*master);
    }
  }

  for (const auto& slave : slave_positions) {
    if (used_slaves.count(slave.position_id) == 0) {
      result.orphan_slave.push_back(slave);
    }
  }

  for (const auto& m : result.unpaired_master) {
    std::cerr << "[Reconciler] WARNING: unpaired master position="
              << m.position_id << " instrument_id=" << m.instrument_id
              << " volume=" << m.volume << "; will be opened on the slave.\n";
  }
  for (const auto& s : result.orphan_slave) {
    std::cerr << "[Reconciler] WARNING: orphan slave position="
              << s.position_id << " instrument_id=" << s.instrument_id
              << " volume=" << s.volume << "; left untouched.\n";
  }

  return result;
}

}  // namespace copier
