#include "copier/engine/copier_engine.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iostream>
#include <utility>

namespace copier {

// -----------------------------------------------------------------------------
// Constructor: build components, no threads yet
// -----------------------------------------------------------------------------
CopierEngine::CopierEngine(CopierConfig config,
                           std::unique_ptr<ITransport> transport)
    : config_(std::move(config)),
      mapper_(config_.master_symbols, config_.slave_symbols,
              config_.symbol_aliases),
      reconciler_(mapper_, config_.reconcile),
      calculator_(buildVolumePolicy(config_.volume, mapper_),
                  config_.volume.limits),
      trade_bucket_("trade", config_.rate_limits.trade_per_second),
      data_bucket_("data", config_.rate_limits.data_per_second),
      classifier_(config_.session.master.account_id) {
  for (const auto& instrument : config_.instruments) {
    catalog_.upsert(instrument.broker, instrument.spec);
  }

  SessionCallbacks callbacks;
  callbacks.on_execution = [this](ExecutionEvent e) {
    pool_->submit(std::move(e));
  };
  callbacks.on_open_decision = [this](CopyDecision d) {
    pool_->submit(std::move(d));
  };
  callbacks.on_new_epoch = [this] { classifier_.resetSequences(); };

  coordinator_ = std::make_unique<SessionCoordinator>(
      std::move(transport), config_.session, mapper_, catalog_, ledger_,
      reconciler_, std::move(callbacks));

  dispatcher_ = std::make_unique<OrderDispatcher>(
      ledger_, mapper_, catalog_, calculator_, *coordinator_, trade_bucket_,
      data_bucket_, config_.session.slave.account_id, config_.dispatch,
      [this] { coordinator_->requestReconciliation(); });

  // More workers than trading tokens per second would only queue on the
  // bucket.
  const std::size_t workers = std::clamp<std::size_t>(
      config_.workers, 1, config_.rate_limits.trade_per_second);
  pool_ = std::make_unique<CopyWorkerPool>(workers, classifier_, *dispatcher_,
                                           ledger_);
  pool_->onReport(
      [this](const DispatchReportEvent& r) { publishReport(r); });

  if (config_.ipc.enabled) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc.cmd_endpoint, config_.ipc.pub_endpoint);
  }
}

CopierEngine::~CopierEngine() { stop(); }

void CopierEngine::addReportObserver(ReportObserver observer) {
  std::lock_guard lock(observers_mutex_);
  observers_.push_back(std::move(observer));
}

// -----------------------------------------------------------------------------
// start(): consumers first, then the session that feeds them
// -----------------------------------------------------------------------------
void CopierEngine::start() {
  if (running_ || stopped_) {
    return;
  }

  if (ipc_server_ && !ipc_server_->start()) {
    ipc_server_.reset();
  }

  pool_->start();
  coordinator_->start();
  running_ = true;

  std::cout << "[CopierEngine] started. workers=" << pool_->size()
            << " policy=" << policyName(calculator_.policy())
            << " master=" << config_.session.master.account_id
            << " slave=" << config_.session.slave.account_id << "\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void CopierEngine::stop() {
  if (!running_) {
    return;
  }

  dispatcher_->beginShutdown(config_.shutdown_grace);

  const std::size_t dropped = pool_->stop();

  trade_bucket_.cancel();
  data_bucket_.cancel();

  coordinator_->stop();

  if (ipc_server_) {
    ipc_server_->stop();
  }

  running_ = false;
  stopped_ = true;

  const auto s = dispatcher_->stats();
  std::cout << "[CopierEngine] stopped. dropped=" << dropped
            << " opened=" << s.opened << " adjusted=" << s.adjusted
            << " closed=" << s.closed << " skipped=" << s.skipped
            << " failed=" << s.failed
            << " ledger_size=" << ledger_.size() << "\n";
}

void CopierEngine::publishReport(const DispatchReportEvent& report) {
  if (ipc_server_ && ipc_server_->running()) {
    ipc_server_->pushTelemetry(report);
  }
  std::lock_guard lock(observers_mutex_);
  for (const auto& observer : observers_) {
    observer(report);
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string CopierEngine::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  if (cmd == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (cmd == "STATUS") {
    response["status"] = "ok";
    response["session"] = toString(coordinator_->state());
    response["fatal"] = coordinator_->fatal();
    response["epoch"] = coordinator_->epoch();

    nlohmann::json positions_json = nlohmann::json::array();
    for (const auto& pos : ledger_.snapshot()) {
      nlohmann::json p;
      p["master_position_id"] = pos.master_position_id;
      p["instrument_id"] = pos.instrument_id;
      p["slave_instrument_id"] = pos.slave_instrument_id;
      if (pos.slave_position_id) {
        p["slave_position_id"] = *pos.slave_position_id;
      }
      p["side"] = domain::toString(pos.side);
      p["master_volume"] = pos.master_volume;
      p["slave_volume"] = pos.slave_volume;
      positions_json.push_back(std::move(p));
    }
    response["positions"] = std::move(positions_json);

    const auto s = dispatcher_->stats();
    response["stats"] = {{"opened", s.opened},   {"adjusted", s.adjusted},
                         {"closed", s.closed},   {"skipped", s.skipped},
                         {"failed", s.failed},
                         {"rate_limited", trade_bucket_.delayedCount()}};
  } else if (cmd == "RECONCILE") {
    coordinator_->requestReconciliation();
    response["status"] = "ok";
    response["response"] = "Reconciliation queued";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace copier
