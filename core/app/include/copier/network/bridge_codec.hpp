#pragma once

#include "copier/domain/errors.hpp"
#include "copier/domain/instrument_spec.hpp"
#include "copier/domain/order_request.hpp"
#include "copier/domain/position.hpp"
#include "copier/events/execution_event.hpp"
#include "copier/session/i_transport.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace copier {
namespace bridge {

// -----------------------------------------------------------------------------
// Bridge wire format
// -----------------------------------------------------------------------------
//
// @brief  JSON messages exchanged with the broker bridge process.
//
// @details
// Requests (DEALER -> bridge ROUTER), one frame each:
//   {"id": <u64>, "type": "<REQUEST_TYPE>", "payload": {...}}
//
// Responses (bridge -> DEALER), correlated by id:
//   {"id": <u64>, "ok": true|false, "error": "<ERROR_CODE>",
//    "message": "...", "payload": {...}}
//
// Notifications (bridge PUB -> SUB):
//   {"type": "EXECUTION" | "SPOT" | "HEARTBEAT", "payload": {...}}
//
// Decoders throw nlohmann::json::exception on malformed input; callers catch
// and log, as every other JSON consumer in the engine does.
// -----------------------------------------------------------------------------

struct Response {
  std::uint64_t id{0};
  bool ok{false};
  ErrorKind error{ErrorKind::None};
  std::string message;
  nlohmann::json payload;
};

std::string encodeRequest(std::uint64_t id, const std::string& type,
                          const nlohmann::json& payload);

Response decodeResponse(const std::string& raw);

// std::nullopt for heartbeats and notification types the copier ignores.
std::optional<TransportNotification> decodeNotification(const std::string& raw);

// Payload for NEW_ORDER / CLOSE_POSITION; the request type comes from
// requestTypeFor().
nlohmann::json encodeOrder(domain::AccountId account_id,
                           const domain::OrderRequest& request);
const char* requestTypeFor(const domain::OrderRequest& request);

domain::OrderOutcome parseOrderOutcome(const Response& response);

ExecutionEvent parseExecution(const nlohmann::json& payload);
SpotEvent parseSpot(const nlohmann::json& payload);
std::vector<domain::LivePosition> parsePositions(const nlohmann::json& payload);
std::vector<domain::InstrumentSpec> parseSymbols(const nlohmann::json& payload);

ExecutionEventKind parseExecutionKind(const std::string& wire);
ErrorKind parseErrorCode(const std::string& wire);
domain::Side parseSide(const std::string& wire);
const char* sideToWire(domain::Side side);

}  // namespace bridge
}  // namespace copier
