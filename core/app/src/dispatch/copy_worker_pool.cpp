#include "copier/dispatch/copy_worker_pool.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>

namespace copier {

CopyWorkerPool::CopyWorkerPool(std::size_t worker_count,
                               EventClassifier& classifier,
                               OrderDispatcher& dispatcher,
                               const PositionLedger& ledger)
    : classifier_(classifier), dispatcher_(dispatcher), ledger_(ledger) {
  worker_count = std::max<std::size_t>(worker_count, 1);
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.push_back(
        std::make_unique<EventLoopThread>("copy-worker-" + std::to_string(i)));
    wire(*workers_.back());
  }
}

CopyWorkerPool::~CopyWorkerPool() { stop(); }

// -----------------------------------------------------------------------------
// wire(): classify and dispatch stages on one worker's bus
// -----------------------------------------------------------------------------
void CopyWorkerPool::wire(EventLoopThread& worker) {
  EventBus& bus = worker.eventBus();

  bus.subscribe<ExecutionEvent>([this, &bus](const ExecutionEvent& e) {
    CopyDecision decision = classifier_.classify(e, ledger_);
    if (decision.reason == DecisionReason::Duplicate) {
      std::cout << "[EventClassifier] SKIP DUPLICATE master_position_id="
                << e.master_position_id << " instrument_id="
                << e.instrument_id << " sequence_no=" << e.sequence_no
                << "\n";
    }
    bus.publish(decision);
  });

  bus.subscribe<CopyDecision>([this, &bus](const CopyDecision& d) {
    bus.publish(dispatcher_.execute(d));
  });
}

void CopyWorkerPool::onReport(ReportCallback callback) {
  for (auto& worker : workers_) {
    worker->eventBus().subscribe<DispatchReportEvent>(callback);
  }
}

void CopyWorkerPool::start() {
  for (auto& worker : workers_) {
    worker->start();
  }
  accepting_.store(true);
}

std::size_t CopyWorkerPool::stop() {
  accepting_.store(false);

  // Signal every worker before joining any of them, so no worker starts a
  // queued item while another one finishes its in-flight dispatch.
  for (auto& worker : workers_) {
    worker->requestStop();
  }
  for (auto& worker : workers_) {
    worker->stop();
  }

  std::size_t dropped = 0;
  for (auto& worker : workers_) {
    for (const Event& event : worker->takePending()) {
      ++dropped;
      if (const auto* e = std::get_if<ExecutionEvent>(&event)) {
        std::cerr << "[CopyWorkerPool] dropped unstarted event "
                  << toString(e->event_kind)
                  << " master_position_id=" << e->master_position_id
                  << " instrument_id=" << e->instrument_id
                  << " sequence_no=" << e->sequence_no << "\n";
      } else if (const auto* d = std::get_if<CopyDecision>(&event)) {
        std::cerr << "[CopyWorkerPool] dropped unstarted decision "
                  << toString(d->action)
                  << " master_position_id=" << d->master_position_id
                  << " instrument_id=" << d->instrument_id << "\n";
      }
    }
  }
  return dropped;
}

bool CopyWorkerPool::submit(ExecutionEvent event) {
  return route(std::move(event));
}

bool CopyWorkerPool::submit(CopyDecision decision) {
  return route(std::move(decision));
}

bool CopyWorkerPool::route(Event event) {
  const domain::InstrumentId instrument_id = instrumentOf(event);
  if (!accepting_.load()) {
    std::cerr << "[CopyWorkerPool] not running; rejected work for instrument_id="
              << instrument_id << "\n";
    return false;
  }
  workers_[workerFor(instrument_id)]->push(std::move(event));
  return true;
}

std::size_t CopyWorkerPool::workerFor(domain::InstrumentId instrument_id) const {
  return static_cast<std::size_t>(static_cast<std::uint64_t>(instrument_id) %
                                  workers_.size());
}

std::size_t CopyWorkerPool::pending() const {
  std::size_t total = 0;
  for (const auto& worker : workers_) {
    total += worker->pendingCount();
  }
  return total;
}

}  // namespace copier
