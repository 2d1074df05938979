#pragma once

#include "copier/concurrent/thread_safe_queue.hpp"
#include "copier/dispatch/i_trade_gateway.hpp"
#include "copier/events/copy_decision.hpp"
#include "copier/events/execution_event.hpp"
#include "copier/ledger/ledger_reconciler.hpp"
#include "copier/ledger/position_ledger.hpp"
#include "copier/session/coordinator_command.hpp"
#include "copier/session/i_transport.hpp"
#include "copier/session/session_state.hpp"
#include "copier/symbols/symbol_catalog.hpp"
#include "copier/symbols/symbol_mapper.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace copier {

struct SessionCallbacks {
  // Master execution event to be classified (RUNNING only).
  std::function<void(ExecutionEvent)> on_execution;
  // OPEN for a master position reconciliation could not pair.
  std::function<void(CopyDecision)> on_open_decision;
  // A new connection epoch reached SUBSCRIBED; sequence state is stale.
  std::function<void()> on_new_epoch;
};

// -----------------------------------------------------------------------------
// SessionCoordinator
// -----------------------------------------------------------------------------
//
// @brief  Owns the venue transport and drives the session state machine:
//
//   DISCONNECTED -> CONNECTING -> APP_AUTHENTICATED -> ACCOUNTS_AUTHORIZED
//                -> SUBSCRIBED -> RUNNING
//
// @details
// Any transport failure drops the machine back to DISCONNECTED and the next
// attempt follows an exponential backoff (reconnect_backoff_base doubling up
// to reconnect_backoff_max). max_reconnect_attempts consecutive failures, or
// any AuthError, make the session fatal; the coordinator thread then exits
// and fatal() turns true.
//
// On every entry into SUBSCRIBED the coordinator:
//   1. signals a new epoch (the classifier forgets sequence numbers),
//   2. refreshes instrument specs for the symbols in use,
//   3. queries live positions on both accounts and rebuilds the ledger,
// and only then switches to RUNNING and starts forwarding events. Master
// positions left unpaired are handed out as OPEN decisions after RUNNING.
//
// The coordinator also implements ITradeGateway: order submissions and
// balance queries from the dispatcher are enqueued and executed on the
// coordinator thread, so nothing else ever writes to the transport.
//
// Thread model:
//   start() spawns the coordinator thread; stop() joins it. Every public
//   method is safe from any thread. Transport callbacks only push into
//   commands_.
//
// Ownership:
//   Owned by CopierEngine. Owns the transport (unique_ptr). Holds references
//   to the mapper, catalog, ledger and reconciler, which outlive it.
// -----------------------------------------------------------------------------
class SessionCoordinator : public ITradeGateway {
 public:
  SessionCoordinator(std::unique_ptr<ITransport> transport,
                     SessionSettings settings, const SymbolMapper& mapper,
                     SymbolCatalog& catalog, PositionLedger& ledger,
                     const LedgerReconciler& reconciler,
                     SessionCallbacks callbacks);

  ~SessionCoordinator() override;

  SessionCoordinator(const SessionCoordinator&) = delete;
  SessionCoordinator& operator=(const SessionCoordinator&) = delete;
  SessionCoordinator(SessionCoordinator&&) = delete;
  SessionCoordinator& operator=(SessionCoordinator&&) = delete;

  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Joins the coordinator thread, answers every queued submission with
  // ErrorKind::Transport and disconnects the transport. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  SessionState state() const { return state_.load(); }
  bool fatal() const { return fatal_.load(); }
  std::uint64_t epoch() const { return epoch_.load(); }

  // Blocks until the state equals `target`, the session turns fatal, or
  // the timeout expires. True only in the first case.
  bool waitForState(SessionState target,
                    std::chrono::milliseconds timeout) const;

  // Queues an out-of-band ledger reconciliation (merge mode).
  void requestReconciliation();

  // ITradeGateway
  std::future<domain::OrderOutcome> submitOrder(
      domain::AccountId account_id,
      const domain::OrderRequest& request) override;
  std::future<std::optional<double>> requestBalance(
      domain::AccountId account_id) override;

 private:
  void run();

  // One full connect -> RUNNING pass. ErrorKind::None on success.
  ErrorKind establishSession();

  void enterDisconnected(const std::string& reason);
  void declareFatal(const std::string& reason);

  // False if stop() interrupted the wait.
  bool waitBackoff(std::uint32_t failures);

  ErrorKind rebuildLedger(bool full, std::vector<CopyDecision>& opens);
  void loadInstrumentSpecs();
  void emitOpens(const std::vector<CopyDecision>& opens);

  void handle(CoordinatorCommand command);
  void handleNotification(InboundNotification& inbound);
  void handleOrder(OrderSubmission& submission);
  void handleBalance(BalanceQuery& query);

  void failQueued();
  void setState(SessionState state);

  std::vector<domain::InstrumentId> slaveInstruments() const;

  std::unique_ptr<ITransport> transport_;
  SessionSettings settings_;
  const SymbolMapper& mapper_;
  SymbolCatalog& catalog_;
  PositionLedger& ledger_;
  const LedgerReconciler& reconciler_;
  SessionCallbacks callbacks_;

  ThreadSafeQueue<CoordinatorCommand> commands_;

  std::atomic<SessionState> state_{SessionState::Disconnected};
  std::atomic<bool> fatal_{false};
  std::atomic<std::uint64_t> epoch_{0};
  std::atomic<bool> running_{false};

  mutable std::mutex state_mutex_;
  mutable std::condition_variable state_cv_;  // State changes and stop()

  std::thread thread_;
};

}  // namespace copier
