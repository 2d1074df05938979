#pragma once

#include "copier/concurrent/token_bucket.hpp"
#include "copier/dispatch/i_trade_gateway.hpp"
#include "copier/domain/order_request.hpp"
#include "copier/events/copy_decision.hpp"
#include "copier/events/dispatch_report_event.hpp"
#include "copier/ledger/position_ledger.hpp"
#include "copier/symbols/symbol_catalog.hpp"
#include "copier/symbols/symbol_mapper.hpp"
#include "copier/volume/volume_calculator.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace copier {

struct DispatchSettings {
  std::uint32_t max_attempts{3};
  std::chrono::milliseconds backoff_base{200};
  std::chrono::milliseconds backoff_max{5'000};
  std::chrono::milliseconds request_timeout{5'000};
};

struct DispatchStats {
  std::uint64_t opened{0};
  std::uint64_t adjusted{0};
  std::uint64_t closed{0};
  std::uint64_t skipped{0};
  std::uint64_t failed{0};
};

// -----------------------------------------------------------------------------
// OrderDispatcher
// -----------------------------------------------------------------------------
//
// @brief  Executes CopyDecisions against the slave account and records the
//         confirmed result in the PositionLedger.
//
// @details
// Decision mapping:
//   OPEN    market order, master's side, volume from VolumeCalculator
//   CLOSE   close request for the full recorded slave volume
//   ADJUST  partial close of (recorded slave - new slave), in lot steps
//   SKIP    nothing sent
//
// Every trading request passes the trading TokenBucket; the balance query
// used by balance-percentage sizing passes the data bucket. Transient
// failures (Transport, Timeout, RateLimited) are retried with exponential
// backoff up to DispatchSettings::max_attempts; anything else is final.
//
// The ledger is mutated only after the venue accepts the request. A CLOSE
// or ADJUST for a position missing from the ledger yields NotFound and
// fires the reconciliation callback.
//
// Log lines: [OPEN], [ADJUST], [CLOSE], [VOLUME], [ERROR], each with
// master_position_id and instrument_id.
//
// Thread model:
//   execute() runs on worker threads, concurrently for different
//   instruments. A retry blocks only the calling worker. All members are
//   either immutable, thread-safe, or atomics.
//
// Ownership:
//   Owned by CopierEngine. Holds references to the ledger, mapper, catalog,
//   calculator, gateway and both buckets, all of which outlive it.
// -----------------------------------------------------------------------------
class OrderDispatcher {
 public:
  using ReconcileRequest = std::function<void()>;

  OrderDispatcher(PositionLedger& ledger, const SymbolMapper& mapper,
                  const SymbolCatalog& catalog,
                  const VolumeCalculator& calculator, ITradeGateway& gateway,
                  TokenBucket& trade_bucket, TokenBucket& data_bucket,
                  domain::AccountId slave_account_id,
                  DispatchSettings settings,
                  ReconcileRequest on_reconcile_needed = {});

  OrderDispatcher(const OrderDispatcher&) = delete;
  OrderDispatcher& operator=(const OrderDispatcher&) = delete;

  // Outcome of dispatching one decision.
  domain::OrderOutcome dispatch(const CopyDecision& decision);

  // Same, with the volume sent and the number of attempts.
  DispatchReportEvent execute(const CopyDecision& decision);

  // -------------------------------------------------------------------------
  // beginShutdown(grace)
  // -------------------------------------------------------------------------
  //
  // @brief  Stops further retries and bounds every remaining wait by
  //         now + grace. In-flight attempts may still complete.
  //
  // Thread-safety: Safe from any thread. Idempotent.
  // -------------------------------------------------------------------------
  void beginShutdown(std::chrono::milliseconds grace);

  DispatchStats stats() const;

 private:
  void dispatchOpen(const CopyDecision& d, DispatchReportEvent& report);
  void dispatchClose(const CopyDecision& d, DispatchReportEvent& report);
  void dispatchAdjust(const CopyDecision& d, DispatchReportEvent& report);

  // False, with an [ERROR] line and a reconciliation request, when the
  // entry is no longer in the ledger.
  bool recordAdjust(const CopyDecision& d, domain::Volume new_slave_volume);

  domain::OrderOutcome sendWithRetry(domain::OrderRequest request,
                                     std::uint32_t& attempts);

  std::optional<double> fetchSlaveBalance();

  // Sleeps for the backoff after `failed_attempts` failures. False if
  // shutdown interrupted the wait.
  bool backoff(std::uint32_t failed_attempts);

  std::chrono::milliseconds responseWait() const;

  void fail(DispatchReportEvent& report, ErrorKind kind,
            const std::string& message);

  bool shuttingDown() const { return shutting_down_.load(); }

  PositionLedger& ledger_;
  const SymbolMapper& mapper_;
  const SymbolCatalog& catalog_;
  const VolumeCalculator& calculator_;
  ITradeGateway& gateway_;
  TokenBucket& trade_bucket_;
  TokenBucket& data_bucket_;
  domain::AccountId slave_account_id_;
  DispatchSettings settings_;
  ReconcileRequest on_reconcile_needed_;

  std::atomic<bool> shutting_down_{false};
  std::atomic<std::int64_t> grace_deadline_ns_{0};  // steady_clock epoch
  std::mutex shutdown_mutex_;
  std::condition_variable shutdown_cv_;

  std::atomic<std::uint64_t> opened_{0};
  std::atomic<std::uint64_t> adjusted_{0};
  std::atomic<std::uint64_t> closed_{0};
  std::atomic<std::uint64_t> skipped_{0};
  std::atomic<std::uint64_t> failed_{0};
};

}  // namespace copier
