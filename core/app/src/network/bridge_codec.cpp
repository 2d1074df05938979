#include "copier/network/bridge_codec.hpp"

#include <utility>

namespace copier {
namespace bridge {

std::string encodeRequest(std::uint64_t id, const std::string& type,
                          const nlohmann::json& payload) {
  nlohmann::json j;
  j["id"] = id;
  j["type"] = type;
  j["payload"] = payload;
  return j.dump();
}

Response decodeResponse(const std::string& raw) {
  auto j = nlohmann::json::parse(raw);
  Response r;
  r.id = j.at("id").get<std::uint64_t>();
  r.ok = j.at("ok").get<bool>();
  r.message = j.value("message", std::string{});
  if (!r.ok) {
    r.error = parseErrorCode(j.value("error", std::string{"TRANSPORT"}));
  }
  if (j.contains("payload")) {
    r.payload = j.at("payload");
  }
  return r;
}

std::optional<TransportNotification> decodeNotification(const std::string& raw) {
  auto j = nlohmann::json::parse(raw);
  const auto type = j.at("type").get<std::string>();
  if (type == "EXECUTION") {
    return TransportNotification{parseExecution(j.at("payload"))};
  }
  if (type == "SPOT") {
    return TransportNotification{parseSpot(j.at("payload"))};
  }
  if (type == "DISCONNECTED") {
    return TransportNotification{
        TransportLost{j.value("message", std::string{"bridge disconnected"})}};
  }
  return std::nullopt;
}

const char* requestTypeFor(const domain::OrderRequest& request) {
  return request.kind == domain::OrderKind::Market ? "NEW_ORDER"
                                                   : "CLOSE_POSITION";
}

nlohmann::json encodeOrder(domain::AccountId account_id,
                           const domain::OrderRequest& request) {
  nlohmann::json j;
  j["account_id"] = account_id;
  j["symbol_id"] = request.instrument_id;
  j["volume"] = request.volume;
  j["attempt"] = request.attempt_no;
  j["label"] = request.label;
  if (request.kind == domain::OrderKind::Market) {
    j["order_type"] = "MARKET";
    j["trade_side"] = sideToWire(request.side);
  } else if (request.linked_position_id) {
    j["position_id"] = *request.linked_position_id;
  }
  return j;
}

domain::OrderOutcome parseOrderOutcome(const Response& response) {
  domain::OrderOutcome outcome;
  outcome.accepted = response.ok;
  outcome.error_kind = response.ok ? ErrorKind::None : response.error;
  outcome.message = response.message;
  if (response.payload.is_object() && response.payload.contains("position_id")) {
    outcome.slave_position_id =
        response.payload.at("position_id").get<domain::PositionId>();
  }
  return outcome;
}

// -----------------------------------------------------------------------------
// parseExecution()
// -----------------------------------------------------------------------------
// A filled closing order that leaves no volume is reported as
// POSITION_CLOSED, whatever execution type the venue used for it. The
// "trade_side" of a closing deal is opposite to the position it reduces.
// -----------------------------------------------------------------------------
ExecutionEvent parseExecution(const nlohmann::json& payload) {
  ExecutionEvent e;
  e.account_id = payload.at("account_id").get<domain::AccountId>();
  e.master_position_id = payload.at("position_id").get<domain::PositionId>();
  e.instrument_id = payload.at("symbol_id").get<domain::InstrumentId>();
  e.event_kind = parseExecutionKind(payload.at("execution_type").get<std::string>());
  e.side = parseSide(payload.value("trade_side", std::string{"BUY"}));
  e.volume_delta = payload.at("volume_delta").get<double>();
  e.resulting_master_volume = payload.at("position_volume").get<double>();
  e.timestamp_ms = payload.value("timestamp_ms", std::int64_t{0});
  e.sequence_no = payload.at("sequence_no").get<std::uint64_t>();

  e.closing = payload.value("closing_order", false);
  if (e.closing) {
    e.side = domain::opposite(e.side);
  }
  if (e.closing && e.resulting_master_volume <= domain::kVolumeEpsilon &&
      (e.event_kind == ExecutionEventKind::OrderFilled ||
       e.event_kind == ExecutionEventKind::OrderPartiallyFilled)) {
    e.event_kind = ExecutionEventKind::PositionClosed;
  }
  return e;
}

SpotEvent parseSpot(const nlohmann::json& payload) {
  SpotEvent s;
  s.account_id = payload.at("account_id").get<domain::AccountId>();
  s.instrument_id = payload.at("symbol_id").get<domain::InstrumentId>();
  s.bid = payload.value("bid", 0.0);
  s.ask = payload.value("ask", 0.0);
  return s;
}

std::vector<domain::LivePosition> parsePositions(const nlohmann::json& payload) {
  std::vector<domain::LivePosition> positions;
  for (const auto& p : payload.at("positions")) {
    domain::LivePosition pos;
    pos.position_id = p.at("position_id").get<domain::PositionId>();
    pos.instrument_id = p.at("symbol_id").get<domain::InstrumentId>();
    pos.side = parseSide(p.at("trade_side").get<std::string>());
    pos.volume = p.at("volume").get<double>();
    pos.opened_at_ms = p.value("open_timestamp_ms", std::int64_t{0});
    pos.label = p.value("label", std::string{});
    positions.push_back(std::move(pos));
  }
  return positions;
}

std::vector<domain::InstrumentSpec> parseSymbols(const nlohmann::json& payload) {
  std::vector<domain::InstrumentSpec> specs;
  for (const auto& s : payload.at("symbols")) {
    domain::InstrumentSpec spec;
    spec.instrument_id = s.at("symbol_id").get<domain::InstrumentId>();
    spec.name = s.value("name", std::string{});
    spec.digits = s.value("digits", spec.digits);
    spec.pip_position = s.value("pip_position", spec.pip_position);
    spec.lot_size = s.value("lot_size", spec.lot_size);
    spec.lot_step = s.value("step_volume", spec.lot_step);
    spec.quote_is_deposit = s.value("quote_is_deposit", spec.quote_is_deposit);
    specs.push_back(std::move(spec));
  }
  return specs;
}

ExecutionEventKind parseExecutionKind(const std::string& wire) {
  if (wire == "ORDER_ACCEPTED")     return ExecutionEventKind::OrderAccepted;
  if (wire == "ORDER_FILLED")       return ExecutionEventKind::OrderFilled;
  if (wire == "ORDER_PARTIAL_FILL") return ExecutionEventKind::OrderPartiallyFilled;
  if (wire == "POSITION_CLOSED")    return ExecutionEventKind::PositionClosed;
  if (wire == "ORDER_REJECTED")     return ExecutionEventKind::OrderRejected;
  if (wire == "ORDER_CANCELLED")    return ExecutionEventKind::OrderCancelled;
  if (wire == "ORDER_EXPIRED")      return ExecutionEventKind::OrderExpired;
  if (wire == "ORDER_REPLACED")     return ExecutionEventKind::OrderReplaced;
  return ExecutionEventKind::Unknown;
}

ErrorKind parseErrorCode(const std::string& wire) {
  if (wire == "TIMEOUT")         return ErrorKind::Timeout;
  if (wire == "RATE_LIMITED")    return ErrorKind::RateLimited;
  if (wire == "AUTH")            return ErrorKind::Auth;
  if (wire == "NOT_FOUND")       return ErrorKind::NotFound;
  if (wire == "REJECTED")        return ErrorKind::RejectedOrder;
  return ErrorKind::Transport;
}

domain::Side parseSide(const std::string& wire) {
  return wire == "SELL" ? domain::Side::Short : domain::Side::Long;
}

const char* sideToWire(domain::Side side) {
  return side == domain::Side::Short ? "SELL" : "BUY";
}

}  // namespace bridge
}  // namespace copier
