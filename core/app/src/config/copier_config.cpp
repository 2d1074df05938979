#include "copier/config/copier_config.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace copier {

namespace {

std::chrono::milliseconds millis(const nlohmann::json& section,
                                 const char* key,
                                 std::chrono::milliseconds fallback) {
  return std::chrono::milliseconds(
      section.value(key, static_cast<std::int64_t>(fallback.count())));
}

domain::Environment parseEnvironment(const std::string& value) {
  if (value == "demo") return domain::Environment::Demo;
  if (value == "live") return domain::Environment::Live;
  throw std::invalid_argument("environment must be \"demo\" or \"live\", got \"" +
                              value + "\"");
}

domain::Broker parseBroker(const std::string& value) {
  if (value == "master") return domain::Broker::Master;
  if (value == "slave") return domain::Broker::Slave;
  throw std::invalid_argument("broker must be \"master\" or \"slave\", got \"" +
                              value + "\"");
}

void requirePositive(double value, const char* name) {
  if (!(value > 0.0)) {
    throw std::invalid_argument(std::string(name) + " must be positive");
  }
}

AccountCredentials parseAccount(const nlohmann::json& j) {
  AccountCredentials account;
  account.account_id = j.at("account_id").get<domain::AccountId>();
  account.access_token = j.value("access_token", std::string{});
  return account;
}

VolumeConfig parseVolume(const nlohmann::json& j) {
  VolumeConfig v;
  if (j.contains("global_multiplier")) {
    v.global_multiplier = j.at("global_multiplier").get<double>();
    requirePositive(*v.global_multiplier, "volume.global_multiplier");
  }
  v.instrument_multipliers = j.value("instrument_multipliers",
                                     std::map<std::string, double>{});
  v.default_multiplier = j.value("default_multiplier", v.default_multiplier);
  if (j.contains("lot_percentage")) {
    v.lot_percentage = j.at("lot_percentage").get<double>();
    requirePositive(*v.lot_percentage, "volume.lot_percentage");
  }
  v.micro_lots_per_dollar =
      j.value("micro_lots_per_dollar", v.micro_lots_per_dollar);
  v.micro_lots_per_dollar_overrides = j.value(
      "micro_lots_per_dollar_overrides", std::map<std::string, double>{});
  v.pip_equalization = j.value("pip_equalization", v.pip_equalization);
  v.target_risk_ratio = j.value("target_risk_ratio", v.target_risk_ratio);
  v.limits.min_lot_size = j.value("min_lot_size", v.limits.min_lot_size);
  v.limits.max_lot_multiplier =
      j.value("max_lot_multiplier", v.limits.max_lot_multiplier);

  requirePositive(v.default_multiplier, "volume.default_multiplier");
  requirePositive(v.target_risk_ratio, "volume.target_risk_ratio");
  requirePositive(v.limits.min_lot_size, "volume.min_lot_size");
  requirePositive(v.limits.max_lot_multiplier, "volume.max_lot_multiplier");
  return v;
}

StaticInstrument parseInstrument(const nlohmann::json& j) {
  StaticInstrument s;
  s.broker = parseBroker(j.value("broker", std::string{"slave"}));
  s.spec.instrument_id = j.at("symbol_id").get<domain::InstrumentId>();
  s.spec.name = j.value("name", std::string{});
  s.spec.digits = j.value("digits", s.spec.digits);
  s.spec.pip_position = j.value("pip_position", s.spec.pip_position);
  s.spec.lot_size = j.value("lot_size", s.spec.lot_size);
  s.spec.lot_step = j.value("lot_step", s.spec.lot_step);
  s.spec.quote_is_deposit = j.value("quote_is_deposit", s.spec.quote_is_deposit);
  requirePositive(s.spec.lot_step, "instruments[].lot_step");
  return s;
}

}  // namespace

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
CopierConfig parseConfig(const nlohmann::json& j) {
  CopierConfig c;
  const nlohmann::json empty = nlohmann::json::object();

  c.session.environment =
      parseEnvironment(j.value("environment", std::string{"demo"}));

  const auto& credentials = j.contains("credentials") ? j.at("credentials")
                                                      : j.at("master");
  c.session.client_id = credentials.value("client_id", std::string{});
  c.session.client_secret = credentials.value("client_secret", std::string{});
  c.session.master = parseAccount(j.at("master"));
  c.session.slave = parseAccount(j.at("slave"));
  if (c.session.master.account_id == c.session.slave.account_id) {
    throw std::invalid_argument("master and slave must be different accounts");
  }

  const auto& bridge = j.contains("bridge") ? j.at("bridge") : empty;
  c.bridge.request_endpoint =
      bridge.value("request_endpoint", c.bridge.request_endpoint);
  c.bridge.notify_endpoint =
      bridge.value("notify_endpoint", c.bridge.notify_endpoint);
  c.bridge.request_timeout =
      millis(bridge, "request_timeout_ms", c.bridge.request_timeout);
  c.bridge.heartbeat_timeout =
      millis(bridge, "heartbeat_timeout_ms", c.bridge.heartbeat_timeout);

  if (j.contains("volume")) {
    c.volume = parseVolume(j.at("volume"));
  }

  const auto& dispatch = j.contains("dispatch") ? j.at("dispatch") : empty;
  c.rate_limits.trade_per_second =
      dispatch.value("trade_per_second", c.rate_limits.trade_per_second);
  c.rate_limits.data_per_second =
      dispatch.value("data_per_second", c.rate_limits.data_per_second);
  c.dispatch.max_attempts =
      dispatch.value("max_attempts", c.dispatch.max_attempts);
  c.dispatch.backoff_base =
      millis(dispatch, "backoff_base_ms", c.dispatch.backoff_base);
  c.dispatch.backoff_max =
      millis(dispatch, "backoff_max_ms", c.dispatch.backoff_max);
  c.dispatch.request_timeout =
      millis(dispatch, "request_timeout_ms", c.dispatch.request_timeout);
  c.shutdown_grace = millis(dispatch, "shutdown_grace_ms", c.shutdown_grace);
  if (c.rate_limits.trade_per_second == 0 ||
      c.rate_limits.data_per_second == 0) {
    throw std::invalid_argument("dispatch rates must be at least 1/s");
  }
  if (c.dispatch.max_attempts == 0) {
    throw std::invalid_argument("dispatch.max_attempts must be at least 1");
  }
  c.session.order_stale_after = c.dispatch.request_timeout;

  const auto& session = j.contains("session") ? j.at("session") : empty;
  c.session.max_reconnect_attempts = session.value(
      "max_reconnect_attempts", c.session.max_reconnect_attempts);
  c.session.reconnect_backoff_base = millis(
      session, "reconnect_backoff_base_ms", c.session.reconnect_backoff_base);
  c.session.reconnect_backoff_max = millis(
      session, "reconnect_backoff_max_ms", c.session.reconnect_backoff_max);

  const auto& reconcile = j.contains("reconcile") ? j.at("reconcile") : empty;
  c.reconcile.open_time_tolerance_ms = reconcile.value(
      "open_time_tolerance_ms", c.reconcile.open_time_tolerance_ms);
  c.reconcile.max_volume_ratio =
      reconcile.value("max_volume_ratio", c.reconcile.max_volume_ratio);
  c.reconcile.expected_ratio = c.volume.global_multiplier.value_or(
      c.volume.default_multiplier);

  c.workers = j.value("workers", c.workers);
  if (c.workers == 0) {
    throw std::invalid_argument("workers must be at least 1");
  }

  if (j.contains("symbols")) {
    const auto& symbols = j.at("symbols");
    if (symbols.contains("master")) {
      c.master_symbols = symbols.at("master").get<SymbolMapper::SymbolTable>();
    }
    if (symbols.contains("slave")) {
      c.slave_symbols = symbols.at("slave").get<SymbolMapper::SymbolTable>();
    }
    c.symbol_aliases =
        symbols.value("aliases", std::map<std::string, std::string>{});
  }

  if (j.contains("instruments")) {
    for (const auto& instrument : j.at("instruments")) {
      c.instruments.push_back(parseInstrument(instrument));
    }
  }

  const auto& ipc = j.contains("ipc") ? j.at("ipc") : empty;
  c.ipc.enabled = ipc.value("enabled", c.ipc.enabled);
  c.ipc.cmd_endpoint = ipc.value("cmd_endpoint", c.ipc.cmd_endpoint);
  c.ipc.pub_endpoint = ipc.value("pub_endpoint", c.ipc.pub_endpoint);

  return c;
}

// -----------------------------------------------------------------------------
// loadConfig()
// -----------------------------------------------------------------------------
std::optional<CopierConfig> loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[Config] cannot open " << path << "\n";
    return std::nullopt;
  }

  try {
    auto j = nlohmann::json::parse(in);
    auto config = parseConfig(j);
    std::cout << "[Config] loaded " << path
              << " env=" << domain::toString(config.session.environment)
              << " master=" << config.session.master.account_id
              << " slave=" << config.session.slave.account_id
              << " workers=" << config.workers << "\n";
    return config;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[Config] " << path << ": " << e.what() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[Config] " << path << ": " << e.what() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// buildVolumePolicy()
// -----------------------------------------------------------------------------
VolumePolicy buildVolumePolicy(const VolumeConfig& volume,
                               const SymbolMapper& mapper) {
  const double fallback =
      volume.global_multiplier.value_or(volume.default_multiplier);

  auto resolveNames = [&mapper](const std::map<std::string, double>& by_name,
                                const char* what) {
    std::map<domain::InstrumentId, double> by_id;
    for (const auto& [name, value] : by_name) {
      if (auto id = mapper.id(name, domain::Broker::Master)) {
        by_id[*id] = value;
      } else {
        std::cerr << "[Config] " << what << ": unknown symbol " << name
                  << ", ignored\n";
      }
    }
    return by_id;
  };

  if (volume.global_multiplier) {
    return GlobalMultiplier{*volume.global_multiplier};
  }
  if (!volume.instrument_multipliers.empty()) {
    return InstrumentMultiplierTable{
        resolveNames(volume.instrument_multipliers, "instrument_multipliers"),
        volume.default_multiplier};
  }
  if (volume.lot_percentage) {
    BalancePercentage policy;
    policy.lot_percentage = *volume.lot_percentage;
    policy.micro_lots_per_dollar = volume.micro_lots_per_dollar;
    policy.micro_lots_per_dollar_overrides = resolveNames(
        volume.micro_lots_per_dollar_overrides, "micro_lots_per_dollar_overrides");
    policy.fallback_multiplier = fallback;
    return policy;
  }
  if (volume.pip_equalization) {
    return PipEqualization{volume.target_risk_ratio, fallback};
  }
  return InstrumentMultiplierTable{{}, volume.default_multiplier};
}

}  // namespace copier
