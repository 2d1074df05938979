#pragma once

#include "copier/classifier/event_classifier.hpp"
#include "copier/concurrent/event_loop_thread.hpp"
#include "copier/dispatch/order_dispatcher.hpp"
#include "copier/events/event.hpp"
#include "copier/ledger/position_ledger.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace copier {

// -----------------------------------------------------------------------------
// CopyWorkerPool
// -----------------------------------------------------------------------------
//
// @brief  Fixed set of EventLoopThreads that run classify -> dispatch, one
//         shard per instrument.
//
// @details
// An event is routed to worker (instrument_id mod N). Every event of an
// instrument, and so every event of any one master position, is handled by
// the same thread in arrival order. Different instruments proceed in
// parallel.
//
// Per worker, on its own bus:
//
//   ExecutionEvent --classify--> CopyDecision --dispatch--> DispatchReportEvent
//
// The dispatch of event k completes (ledger updated) before event k+1 of the
// same instrument is classified.
//
// Thread model:
//   submit() is called from the session coordinator thread (and from the
//   coordinator's reconciliation). Handlers run on the worker threads.
//
// Shutdown:
//   stop() refuses new work, lets each worker finish its in-flight item, and
//   drops whatever is still queued, logging every drop.
// -----------------------------------------------------------------------------
class CopyWorkerPool {
 public:
  using ReportCallback = std::function<void(const DispatchReportEvent&)>;

  CopyWorkerPool(std::size_t worker_count, EventClassifier& classifier,
                 OrderDispatcher& dispatcher, const PositionLedger& ledger);

  ~CopyWorkerPool();

  CopyWorkerPool(const CopyWorkerPool&) = delete;
  CopyWorkerPool& operator=(const CopyWorkerPool&) = delete;
  CopyWorkerPool(CopyWorkerPool&&) = delete;
  CopyWorkerPool& operator=(CopyWorkerPool&&) = delete;

  // Registers a callback for every dispatch report, on the worker thread
  // that produced it. Call before start().
  void onReport(ReportCallback callback);

  void start();

  // Returns the number of queued items that were dropped.
  std::size_t stop();

  // False (and logged) when the pool is not accepting work.
  bool submit(ExecutionEvent event);
  bool submit(CopyDecision decision);

  std::size_t workerFor(domain::InstrumentId instrument_id) const;
  std::size_t size() const { return workers_.size(); }
  std::size_t pending() const;

 private:
  bool route(Event event);
  void wire(EventLoopThread& worker);

  EventClassifier& classifier_;
  OrderDispatcher& dispatcher_;
  const PositionLedger& ledger_;

  std::vector<std::unique_ptr<EventLoopThread>> workers_;
  std::atomic<bool> accepting_{false};
};

}  // namespace copier
