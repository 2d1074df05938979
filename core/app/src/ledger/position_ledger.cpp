#include "copier/ledger/position_ledger.hpp"

#include <algorithm>
#include <mutex>

namespace copier {

ErrorKind PositionLedger::upsertOpen(const domain::Position& position) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] =
      positions_.try_emplace(position.master_position_id, position);
  if (!inserted) {
    return ErrorKind::DuplicateKey;
  }
  it->second.master_volume = std::max(0.0, it->second.master_volume);
  it->second.slave_volume = std::max(0.0, it->second.slave_volume);
  return ErrorKind::None;
}

ErrorKind PositionLedger::adjust(domain::PositionId master_position_id,
                                 domain::Volume new_master_volume,
                                 domain::Volume new_slave_volume) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(master_position_id);
  if (it == positions_.end()) {
    return ErrorKind::NotFound;
  }
  it->second.master_volume = std::max(0.0, new_master_volume);
  it->second.slave_volume = std::max(0.0, new_slave_volume);
  return ErrorKind::None;
}

ErrorKind PositionLedger::remove(domain::PositionId master_position_id) {
  std::unique_lock lock(mutex_);
  return positions_.erase(master_position_id) == 0 ? ErrorKind::NotFound
                                                   : ErrorKind::None;
}

std::optional<domain::Position> PositionLedger::removeIfPresent(
    domain::PositionId master_position_id) {
  std::unique_lock lock(mutex_);
  auto it = positions_.find(master_position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  domain::Position removed = it->second;
  positions_.erase(it);
  return removed;
}

std::optional<domain::Position> PositionLedger::find(
    domain::PositionId master_position_id) const {
  std::shared_lock lock(mutex_);
  auto it = positions_.find(master_position_id);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool PositionLedger::contains(domain::PositionId master_position_id) const {
  std::shared_lock lock(mutex_);
  return positions_.count(master_position_id) != 0;
}

std::size_t PositionLedger::size() const {
  std::shared_lock lock(mutex_);
  return positions_.size();
}

std::vector<domain::Position> PositionLedger::snapshot() const {
  std::vector<domain::Position> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
      result.push_back(pos);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.master_position_id < b.master_position_id;
            });
  return result;
}

void PositionLedger::replaceAll(const std::vector<domain::Position>& positions) {
  std::unique_lock lock(mutex_);
  positions_.clear();
  for (const auto& pos : positions) {
    positions_.try_emplace(pos.master_position_id, pos);
  }
}

std::size_t PositionLedger::merge(const std::vector<domain::Position>& positions) {
  std::unique_lock lock(mutex_);
  std::size_t added = 0;
  for (const auto& pos : positions) {
    if (positions_.try_emplace(pos.master_position_id, pos).second) {
      ++added;
    }
  }
  return added;
}

}  // namespace copier
