#pragma once

#include "copier/domain/instrument_spec.hpp"
#include "copier/domain/types.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// SymbolCatalog
// -----------------------------------------------------------------------------
//
// @brief  Per-broker instrument specifications and last known mid prices.
//
// @details
// Specs come from the configuration file at startup and are refreshed from
// the venue's symbol query on every session start. Mid prices follow the
// spot subscription. The dispatcher reads lot steps and pip values from here
// when it sizes an order.
//
// Thread model: Writers are the session coordinator thread (specs, quotes);
// readers are the worker threads. Guarded by a shared_mutex.
// -----------------------------------------------------------------------------
class SymbolCatalog {
 public:
  static constexpr domain::Volume kDefaultLotStep = 0.01;

  SymbolCatalog() = default;

  SymbolCatalog(const SymbolCatalog&) = delete;
  SymbolCatalog& operator=(const SymbolCatalog&) = delete;

  void upsert(domain::Broker broker, const domain::InstrumentSpec& spec);

  void updateQuote(domain::Broker broker, domain::InstrumentId instrument_id,
                   double bid, double ask);

  std::optional<domain::InstrumentSpec> spec(
      domain::Broker broker, domain::InstrumentId instrument_id) const;

  // Lot step for the instrument, kDefaultLotStep when the spec is unknown.
  domain::Volume lotStep(domain::Broker broker,
                         domain::InstrumentId instrument_id) const;

  std::optional<double> midPrice(domain::Broker broker,
                                 domain::InstrumentId instrument_id) const;

  // Monetary value of one pip for one lot in the account's deposit
  // currency, or std::nullopt when the spec or a required price is missing.
  std::optional<double> pipValuePerLot(
      domain::Broker broker, domain::InstrumentId instrument_id) const;

  // -------------------------------------------------------------------------
  // computePipValue(spec, mid)
  // -------------------------------------------------------------------------
  //
  // @brief  Pip value per lot for a spec, given an optional mid price.
  //
  // @details
  //   pip_size = 10^-pip_position
  //   quote currency == deposit currency:  pip_size * lot_size
  //   otherwise, with a mid price:         pip_size / mid * lot_size
  //   otherwise:                           unavailable
  // -------------------------------------------------------------------------
  static std::optional<double> computePipValue(
      const domain::InstrumentSpec& spec, std::optional<double> mid);

 private:
  using Key = std::pair<domain::Broker, domain::InstrumentId>;

  mutable std::shared_mutex mutex_;
  std::map<Key, domain::InstrumentSpec> specs_;
  std::map<Key, double> mids_;
};

}  // namespace copier
