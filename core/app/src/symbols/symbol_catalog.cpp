#include "copier/symbols/symbol_catalog.hpp"

#include <cmath>
#include <mutex>

namespace copier {

void SymbolCatalog::upsert(domain::Broker broker,
                           const domain::InstrumentSpec& spec) {
  std::unique_lock lock(mutex_);
  specs_[{broker, spec.instrument_id}] = spec;
}

void SymbolCatalog::updateQuote(domain::Broker broker,
                                domain::InstrumentId instrument_id,
                                double bid, double ask) {
  if (bid <= 0.0 || ask <= 0.0) {
    return;
  }
  std::unique_lock lock(mutex_);
  mids_[{broker, instrument_id}] = (bid + ask) / 2.0;
}

std::optional<domain::InstrumentSpec> SymbolCatalog::spec(
    domain::Broker broker, domain::InstrumentId instrument_id) const {
  std::shared_lock lock(mutex_);
  auto it = specs_.find({broker, instrument_id});
  if (it == specs_.end()) {
    return std::nullopt;
  }
  return it->second;
}

domain::Volume SymbolCatalog::lotStep(domain::Broker broker,
                                      domain::InstrumentId instrument_id) const {
  std::shared_lock lock(mutex_);
  auto it = specs_.find({broker, instrument_id});
  if (it == specs_.end() || it->second.lot_step <= 0.0) {
    return kDefaultLotStep;
  }
  return it->second.lot_step;
}

std::optional<double> SymbolCatalog::midPrice(
    domain::Broker broker, domain::InstrumentId instrument_id) const {
  std::shared_lock lock(mutex_);
  auto it = mids_.find({broker, instrument_id});
  if (it == mids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<double> SymbolCatalog::pipValuePerLot(
    domain::Broker broker, domain::InstrumentId instrument_id) const {
  auto s = spec(broker, instrument_id);
  if (!s) {
    return std::nullopt;
  }
  return computePipValue(*s, midPrice(broker, instrument_id));
}

std::optional<double> SymbolCatalog::computePipValue(
    const domain::InstrumentSpec& spec, std::optional<double> mid) {
  if (spec.lot_size <= 0.0) {
    return std::nullopt;
  }
  const double pip_size = std::pow(10.0, -spec.pip_position);
  if (spec.quote_is_deposit) {
    return pip_size * spec.lot_size;
  }
  if (!mid || *mid <= 0.0) {
    return std::nullopt;
  }
  return pip_size / *mid * spec.lot_size;
}

}  // namespace copier
