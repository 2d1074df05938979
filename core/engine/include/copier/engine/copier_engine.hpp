#pragma once

#include "copier/classifier/event_classifier.hpp"
#include "copier/concurrent/token_bucket.hpp"
#include "copier/config/copier_config.hpp"
#include "copier/dispatch/copy_worker_pool.hpp"
#include "copier/dispatch/order_dispatcher.hpp"
#include "copier/ledger/ledger_reconciler.hpp"
#include "copier/ledger/position_ledger.hpp"
#include "copier/network/ipc_server.hpp"
#include "copier/session/i_transport.hpp"
#include "copier/session/session_coordinator.hpp"
#include "copier/symbols/symbol_catalog.hpp"
#include "copier/symbols/symbol_mapper.hpp"
#include "copier/volume/volume_calculator.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// CopierEngine
// -----------------------------------------------------------------------------
//
// @brief  Programmatic root of the trade copier. Builds every component from
//         a CopierConfig, wires them together and owns their threads.
//
// @details
// Data flow:
//
//   ITransport --notifications--> SessionCoordinator (coordinator thread)
//       | ExecutionEvent (RUNNING only), OPEN decisions after a rebuild
//       v
//   CopyWorkerPool (copy-worker-N threads, sharded by instrument)
//       | classify -> CopyDecision -> OrderDispatcher::execute
//       v
//   DispatchReportEvent --> IpcServer telemetry + report observers
//
//   OrderDispatcher --submitOrder/requestBalance--> SessionCoordinator
//       (ITradeGateway; only the coordinator thread writes to the transport)
//
// Thread layout:
//   main thread        -> start(), wait, stop()
//   coordinator thread -> session state machine, transport I/O
//   copy-worker-N      -> classification and dispatch, one per shard
//   ipc thread         -> REP commands, PUB telemetry (optional)
//
// Shutdown (stop()):
//   1. Dispatcher enters shutdown: no more retries, waits bounded by the
//      grace period.
//   2. Worker pool stops: in-flight items finish, queued items are dropped
//      and logged.
//   3. Rate-limit buckets are cancelled.
//   4. Session coordinator stops and tears down the transport.
//   5. IPC server stops.
//
// Thread model:
//   Construct, start() and stop() from one thread. executeCommand() and the
//   accessors are safe from any thread.
//
// Ownership:
//   Owns everything. Components that hold references to others are declared
//   after them and so destroyed first. One start()/stop() cycle per
//   instance.
// -----------------------------------------------------------------------------
class CopierEngine {
 public:
  using ReportObserver = std::function<void(const DispatchReportEvent&)>;

  CopierEngine(CopierConfig config, std::unique_ptr<ITransport> transport);

  ~CopierEngine();

  CopierEngine(const CopierEngine&) = delete;
  CopierEngine& operator=(const CopierEngine&) = delete;
  CopierEngine(CopierEngine&&) = delete;
  CopierEngine& operator=(CopierEngine&&) = delete;

  // Observers run on worker threads. Register before start().
  void addReportObserver(ReportObserver observer);

  void start();
  void stop();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //   "PING"      -> {"status":"ok","response":"PONG"}
  //   "STATUS"    -> {"status":"ok","session":"RUNNING","fatal":false,
  //                   "epoch":1,"positions":[...],"stats":{...}}
  //   "RECONCILE" -> {"status":"ok","response":"Reconciliation queued"}
  //   other       -> {"status":"error","response":"Unknown command: ..."}
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  SessionState state() const { return coordinator_->state(); }
  bool fatal() const { return coordinator_->fatal(); }
  bool waitForState(SessionState target,
                    std::chrono::milliseconds timeout) const {
    return coordinator_->waitForState(target, timeout);
  }

  const PositionLedger& ledger() const { return ledger_; }
  DispatchStats stats() const { return dispatcher_->stats(); }
  std::size_t workerCount() const { return pool_->size(); }

 private:
  void publishReport(const DispatchReportEvent& report);

  CopierConfig config_;

  SymbolMapper mapper_;
  SymbolCatalog catalog_;
  PositionLedger ledger_;
  LedgerReconciler reconciler_;
  VolumeCalculator calculator_;
  TokenBucket trade_bucket_;
  TokenBucket data_bucket_;
  EventClassifier classifier_;

  std::unique_ptr<SessionCoordinator> coordinator_;
  std::unique_ptr<OrderDispatcher> dispatcher_;
  std::unique_ptr<CopyWorkerPool> pool_;
  std::unique_ptr<IpcServer> ipc_server_;

  std::mutex observers_mutex_;
  std::vector<ReportObserver> observers_;

  bool running_{false};
  bool stopped_{false};
};

}  // namespace copier
