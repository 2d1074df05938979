#pragma once

#include "copier/dispatch/order_dispatcher.hpp"
#include "copier/domain/instrument_spec.hpp"
#include "copier/domain/types.hpp"
#include "copier/ledger/ledger_reconciler.hpp"
#include "copier/network/zmq_bridge_transport.hpp"
#include "copier/session/session_state.hpp"
#include "copier/symbols/symbol_mapper.hpp"
#include "copier/volume/volume_policy.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace copier {

// Sizing inputs as written in the config file. buildVolumePolicy() turns
// them into the single active VolumePolicy.
struct VolumeConfig {
  std::optional<double> global_multiplier;
  std::map<std::string, double> instrument_multipliers;  // By symbol name
  double default_multiplier{0.5};
  std::optional<double> lot_percentage;
  double micro_lots_per_dollar{10.0};
  std::map<std::string, double> micro_lots_per_dollar_overrides;
  bool pip_equalization{false};
  double target_risk_ratio{1.0};
  VolumeLimits limits;
};

struct RateLimitConfig {
  std::size_t trade_per_second{50};
  std::size_t data_per_second{5};
};

struct IpcConfig {
  bool enabled{true};
  std::string cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string pub_endpoint{"tcp://127.0.0.1:5557"};
};

struct StaticInstrument {
  domain::Broker broker{domain::Broker::Slave};
  domain::InstrumentSpec spec;
};

// -----------------------------------------------------------------------------
// CopierConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the copier reads at startup, with defaults for every
//         field.
//
// @details
// Example (all sections optional except credentials):
//
//   {
//     "environment": "demo",
//     "bridge":  {"request_endpoint": "tcp://127.0.0.1:5560",
//                 "notify_endpoint":  "tcp://127.0.0.1:5561",
//                 "request_timeout_ms": 5000, "heartbeat_timeout_ms": 30000},
//     "credentials": {"client_id": "...", "client_secret": "..."},
//     "master":  {"account_id": 111, "access_token": "..."},
//     "slave":   {"account_id": 222, "access_token": "..."},
//     "volume":  {"instrument_multipliers": {"EURUSD": 0.5},
//                 "default_multiplier": 0.5, "min_lot_size": 0.01,
//                 "max_lot_multiplier": 2.0},
//     "dispatch": {"trade_per_second": 50, "data_per_second": 5,
//                  "max_attempts": 3, "backoff_base_ms": 200,
//                  "backoff_max_ms": 5000, "request_timeout_ms": 5000,
//                  "shutdown_grace_ms": 5000},
//     "session": {"max_reconnect_attempts": 10,
//                 "reconnect_backoff_base_ms": 5000,
//                 "reconnect_backoff_max_ms": 300000},
//     "reconcile": {"open_time_tolerance_ms": 60000, "max_volume_ratio": 2.0},
//     "workers": 4,
//     "symbols": {"master": {"EURUSD": 1}, "slave": {"EURUSD": 1},
//                 "aliases": {"GOLD": "XAUUSD"}},
//     "instruments": [{"broker": "slave", "symbol_id": 41, "name": "XAUUSD",
//                      "pip_position": 2, "lot_size": 100,
//                      "lot_step": 0.01, "quote_is_deposit": true}],
//     "ipc": {"enabled": true, "cmd_endpoint": "tcp://127.0.0.1:5556",
//             "pub_endpoint": "tcp://127.0.0.1:5557"}
//   }
//
// When "symbols" is absent both brokers use SymbolMapper::defaultSymbolTable().
// -----------------------------------------------------------------------------
struct CopierConfig {
  SessionSettings session;
  BridgeSettings bridge;
  VolumeConfig volume;
  DispatchSettings dispatch;
  RateLimitConfig rate_limits;
  std::chrono::milliseconds shutdown_grace{5'000};
  ReconcileSettings reconcile;
  std::size_t workers{4};
  SymbolMapper::SymbolTable master_symbols{SymbolMapper::defaultSymbolTable()};
  SymbolMapper::SymbolTable slave_symbols{SymbolMapper::defaultSymbolTable()};
  std::map<std::string, std::string> symbol_aliases;
  std::vector<StaticInstrument> instruments;
  IpcConfig ipc;
};

// Reads and parses `path`. Problems are reported on stderr and yield
// std::nullopt.
std::optional<CopierConfig> loadConfig(const std::string& path);

// Throws nlohmann::json::exception on a wrong type, std::invalid_argument on
// an invalid value.
CopierConfig parseConfig(const nlohmann::json& j);

// -----------------------------------------------------------------------------
// buildVolumePolicy(volume, mapper)
// -----------------------------------------------------------------------------
// First configured policy wins, in this order:
//   global_multiplier, instrument_multipliers, lot_percentage,
//   pip_equalization.
// With nothing configured the instrument table applies with only its
// default. Fallback multipliers for the balance and pip policies use the
// global multiplier when set, otherwise default_multiplier. Symbol names are
// resolved against the master table; unknown names are reported and skipped.
// -----------------------------------------------------------------------------
VolumePolicy buildVolumePolicy(const VolumeConfig& volume,
                               const SymbolMapper& mapper);

}  // namespace copier
