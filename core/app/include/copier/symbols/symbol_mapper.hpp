#pragma once

#include "copier/domain/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// SymbolMapper
// -----------------------------------------------------------------------------
//
// @brief  Translates instrument ids between the master and slave catalogs by
//         way of the shared symbol name.
//
// @details
// Each broker numbers its instruments independently (EURUSD may be 1 on one
// venue and 1001 on another). The mapper holds a name -> id table per broker
// and resolves an id on one side to the id carrying the same name on the
// other side. Optional aliases fold broker-specific spellings ("GOLD") into
// the canonical name ("XAUUSD") before lookup.
//
// Thread model: Immutable after construction. Safe for concurrent reads.
// -----------------------------------------------------------------------------
class SymbolMapper {
 public:
  using SymbolTable = std::map<std::string, domain::InstrumentId>;

  SymbolMapper(SymbolTable master_symbols, SymbolTable slave_symbols,
               std::map<std::string, std::string> aliases = {});

  // Table shipped as the default for both accounts of the same broker.
  static SymbolTable defaultSymbolTable();

  // -------------------------------------------------------------------------
  // resolve(instrument_id, source, target)
  // -------------------------------------------------------------------------
  //
  // @brief  Id on `target` for the instrument `instrument_id` on `source`.
  //
  // @return The mapped id, or std::nullopt (NotFoundError) when either side
  //         does not list the symbol.
  // -------------------------------------------------------------------------
  std::optional<domain::InstrumentId> resolve(domain::InstrumentId instrument_id,
                                              domain::Broker source,
                                              domain::Broker target) const;

  std::optional<std::string> name(domain::InstrumentId instrument_id,
                                  domain::Broker broker) const;

  std::optional<domain::InstrumentId> id(const std::string& symbol,
                                         domain::Broker broker) const;

  // All instrument ids known on `broker`, ascending.
  std::vector<domain::InstrumentId> instruments(domain::Broker broker) const;

 private:
  struct Catalog {
    std::unordered_map<std::string, domain::InstrumentId> by_name;
    std::unordered_map<domain::InstrumentId, std::string> by_id;
  };

  const Catalog& catalog(domain::Broker broker) const;
  std::string canonical(const std::string& symbol) const;

  Catalog master_;
  Catalog slave_;
  std::map<std::string, std::string> aliases_;
};

}  // namespace copier
