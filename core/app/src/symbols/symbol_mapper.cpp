#include "copier/symbols/symbol_mapper.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace copier {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return s;
}

}  // namespace

SymbolMapper::SymbolMapper(SymbolTable master_symbols,
                           SymbolTable slave_symbols,
                           std::map<std::string, std::string> aliases) {
  for (auto& [alias, target] : aliases) {
    aliases_[upper(alias)] = upper(target);
  }

  auto load = [this](Catalog& catalog, const SymbolTable& table) {
    for (const auto& [symbol, instrument_id] : table) {
      const std::string key = canonical(symbol);
      catalog.by_name[key] = instrument_id;
      catalog.by_id[instrument_id] = key;
    }
  };
  load(master_, master_symbols);
  load(slave_, slave_symbols);
}

// Ids as listed by the venue's demo environment for the majors, metals,
// crypto, indices and energies the copier is normally configured with.
SymbolMapper::SymbolTable SymbolMapper::defaultSymbolTable() {
  return {
      {"EURUSD", 1},  {"GBPUSD", 2},  {"USDJPY", 3},  {"USDCHF", 4},
      {"AUDUSD", 5},  {"USDCAD", 6},  {"NZDUSD", 7},  {"XAUUSD", 41},
      {"XAGUSD", 42}, {"BTCUSD", 43}, {"ETHUSD", 44}, {"US30", 45},
      {"SPX500", 46}, {"NAS100", 47}, {"CRUDE", 48},  {"BRENT", 49},
  };
}

std::optional<domain::InstrumentId> SymbolMapper::resolve(
    domain::InstrumentId instrument_id, domain::Broker source,
    domain::Broker target) const {
  const Catalog& from = catalog(source);
  auto name_it = from.by_id.find(instrument_id);
  if (name_it == from.by_id.end()) {
    return std::nullopt;
  }
  const Catalog& to = catalog(target);
  auto id_it = to.by_name.find(name_it->second);
  if (id_it == to.by_name.end()) {
    return std::nullopt;
  }
  return id_it->second;
}

std::optional<std::string> SymbolMapper::name(
    domain::InstrumentId instrument_id, domain::Broker broker) const {
  const Catalog& c = catalog(broker);
  auto it = c.by_id.find(instrument_id);
  if (it == c.by_id.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::InstrumentId> SymbolMapper::id(
    const std::string& symbol, domain::Broker broker) const {
  const Catalog& c = catalog(broker);
  auto it = c.by_name.find(canonical(symbol));
  if (it == c.by_name.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::InstrumentId> SymbolMapper::instruments(
    domain::Broker broker) const {
  const Catalog& c = catalog(broker);
  std::vector<domain::InstrumentId> ids;
  ids.reserve(c.by_id.size());
  for (const auto& [instrument_id, symbol] : c.by_id) {
    ids.push_back(instrument_id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

const SymbolMapper::Catalog& SymbolMapper::catalog(
    domain::Broker broker) const {
  return broker == domain::Broker::Master ? master_ : slave_;
}

std::string SymbolMapper::canonical(const std::string& symbol) const {
  std::string key = upper(symbol);
  auto it = aliases_.find(key);
  return it != aliases_.end() ? it->second : key;
}

}  // namespace copier
