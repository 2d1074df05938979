#include "copier/dispatch/order_dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace copier {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::int64_t toNs(SteadyClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace

OrderDispatcher::OrderDispatcher(PositionLedger& ledger,
                                 const SymbolMapper& mapper,
                                 const SymbolCatalog& catalog,
                                 const VolumeCalculator& calculator,
                                 ITradeGateway& gateway,
                                 TokenBucket& trade_bucket,
                                 TokenBucket& data_bucket,
                                 domain::AccountId slave_account_id,
                                 DispatchSettings settings,
                                 ReconcileRequest on_reconcile_needed)
    : ledger_(ledger),
      mapper_(mapper),
      catalog_(catalog),
      calculator_(calculator),
      gateway_(gateway),
      trade_bucket_(trade_bucket),
      data_bucket_(data_bucket),
      slave_account_id_(slave_account_id),
      settings_(settings),
      on_reconcile_needed_(std::move(on_reconcile_needed)) {
  settings_.max_attempts = std::max<std::uint32_t>(settings_.max_attempts, 1);
}

domain::OrderOutcome OrderDispatcher::dispatch(const CopyDecision& decision) {
  return execute(decision).outcome;
}

DispatchReportEvent OrderDispatcher::execute(const CopyDecision& decision) {
  DispatchReportEvent report;
  report.decision = decision;

  switch (decision.action) {
    case CopyAction::Open:
      dispatchOpen(decision, report);
      break;
    case CopyAction::Close:
      dispatchClose(decision, report);
      break;
    case CopyAction::Adjust:
      dispatchAdjust(decision, report);
      break;
    case CopyAction::Skip:
      skipped_.fetch_add(1);
      break;
  }
  return report;
}

// -----------------------------------------------------------------------------
// dispatchOpen(): size, send market order, record on acceptance
// -----------------------------------------------------------------------------
void OrderDispatcher::dispatchOpen(const CopyDecision& d,
                                   DispatchReportEvent& report) {
  if (ledger_.contains(d.master_position_id)) {
    fail(report, ErrorKind::DuplicateKey, "master position already mirrored");
    return;
  }

  auto slave_instrument = mapper_.resolve(d.instrument_id,
                                          domain::Broker::Master,
                                          domain::Broker::Slave);
  if (!slave_instrument) {
    fail(report, ErrorKind::NotFound, "no slave symbol for instrument");
    return;
  }

  AccountSnapshot snapshot;
  snapshot.lot_step = catalog_.lotStep(domain::Broker::Slave, *slave_instrument);
  if (calculator_.needsBalance()) {
    snapshot.slave_balance = fetchSlaveBalance();
  }
  if (calculator_.needsPipValues()) {
    snapshot.master_pip_value =
        catalog_.pipValuePerLot(domain::Broker::Master, d.instrument_id);
    snapshot.slave_pip_value =
        catalog_.pipValuePerLot(domain::Broker::Slave, *slave_instrument);
  }

  const VolumeResult sized =
      calculator_.compute(d.instrument_id, d.master_volume, snapshot);

  std::cout << "[VOLUME] master_position_id=" << d.master_position_id
            << " instrument_id=" << d.instrument_id
            << " policy=" << policyName(calculator_.policy())
            << " master_volume=" << d.master_volume
            << " raw=" << sized.raw_volume
            << " slave_volume=" << sized.slave_volume
            << " clamped_min=" << sized.clamped_to_min
            << " capped=" << sized.capped << "\n";
  if (sized.fallback_used) {
    std::cerr << "[VOLUME] " << toString(sized.warning)
              << " master_position_id=" << d.master_position_id
              << " instrument_id=" << d.instrument_id
              << " policy data unavailable, fallback multiplier used\n";
  }

  domain::OrderRequest request;
  request.kind = domain::OrderKind::Market;
  request.instrument_id = *slave_instrument;
  request.side = d.side;
  request.volume = sized.slave_volume;
  request.label = domain::makeCopyLabel(d.master_position_id);
  report.slave_volume = sized.slave_volume;

  report.outcome = sendWithRetry(request, report.attempts);
  if (!report.outcome.accepted) {
    fail(report, report.outcome.error_kind, report.outcome.message);
    return;
  }

  domain::Position position;
  position.instrument_id = d.instrument_id;
  position.slave_instrument_id = *slave_instrument;
  position.master_position_id = d.master_position_id;
  position.slave_position_id = report.outcome.slave_position_id;
  position.side = d.side;
  position.master_volume = d.master_volume;
  position.slave_volume = sized.slave_volume;
  position.opened_at_ms = d.opened_at_ms;

  if (ledger_.upsertOpen(position) != ErrorKind::None) {
    // Slave order is live but the key was taken meanwhile; reconciliation
    // will surface the extra slave position as an orphan.
    fail(report, ErrorKind::DuplicateKey,
         "ledger entry appeared while open was in flight");
    return;
  }
  if (!position.slave_position_id) {
    std::cerr << "[OrderDispatcher] WARNING: open accepted without a slave "
                 "position id, master_position_id="
              << d.master_position_id << "\n";
  }

  opened_.fetch_add(1);
  std::cout << "[OPEN] master_position_id=" << d.master_position_id
            << " instrument_id=" << d.instrument_id
            << " slave_instrument_id=" << *slave_instrument
            << " side=" << domain::toString(d.side)
            << " master_volume=" << d.master_volume
            << " slave_volume=" << sized.slave_volume << " slave_position_id="
            << position.slave_position_id.value_or(0) << "\n";
}

// -----------------------------------------------------------------------------
// dispatchClose(): close the full slave volume, remove on acceptance
// -----------------------------------------------------------------------------
void OrderDispatcher::dispatchClose(const CopyDecision& d,
                                    DispatchReportEvent& report) {
  auto existing = ledger_.find(d.master_position_id);
  if (!existing || !existing->slave_position_id) {
    fail(report, ErrorKind::NotFound, "position not in ledger");
    if (on_reconcile_needed_) {
      on_reconcile_needed_();
    }
    return;
  }

  domain::OrderRequest request;
  request.kind = domain::OrderKind::ClosePosition;
  request.instrument_id = existing->slave_instrument_id;
  request.side = existing->side;
  request.volume = existing->slave_volume;
  request.linked_position_id = existing->slave_position_id;
  request.label = domain::makeCopyLabel(d.master_position_id);
  report.slave_volume = existing->slave_volume;

  report.outcome = sendWithRetry(request, report.attempts);
  if (!report.outcome.accepted) {
    if (report.outcome.error_kind == ErrorKind::NotFound) {
      // The slave position is already gone on the venue side.
      ledger_.removeIfPresent(d.master_position_id);
    }
    fail(report, report.outcome.error_kind, report.outcome.message);
    return;
  }

  if (ledger_.remove(d.master_position_id) != ErrorKind::None) {
    std::cerr << "[ERROR] NotFoundError master_position_id="
              << d.master_position_id
              << " instrument_id=" << d.instrument_id
              << " ledger entry vanished before close confirmation\n";
  }

  closed_.fetch_add(1);
  std::cout << "[CLOSE] master_position_id=" << d.master_position_id
            << " instrument_id=" << d.instrument_id
            << " slave_position_id=" << *existing->slave_position_id
            << " slave_volume=" << existing->slave_volume << "\n";
}

// -----------------------------------------------------------------------------
// dispatchAdjust(): partial close of the proportional delta
// -----------------------------------------------------------------------------
void OrderDispatcher::dispatchAdjust(const CopyDecision& d,
                                     DispatchReportEvent& report) {
  auto existing = ledger_.find(d.master_position_id);
  if (!existing || !existing->slave_position_id) {
    fail(report, ErrorKind::NotFound, "position not in ledger");
    if (on_reconcile_needed_) {
      on_reconcile_needed_();
    }
    return;
  }

  const domain::Volume step =
      catalog_.lotStep(domain::Broker::Slave, existing->slave_instrument_id);

  // The master is still open, so the slave keeps at least one step.
  domain::Volume target =
      VolumeCalculator::roundToStep(d.requested_slave_volume, step);
  target = std::min(target, existing->slave_volume);
  const domain::Volume delta =
      VolumeCalculator::floorToStep(existing->slave_volume - target, step);

  if (delta <= domain::kVolumeEpsilon) {
    if (!recordAdjust(d, existing->slave_volume)) {
      fail(report, ErrorKind::NotFound, "position not in ledger");
      return;
    }
    report.outcome.accepted = true;
    report.outcome.slave_position_id = existing->slave_position_id;
    report.outcome.message = "delta below lot step";
    adjusted_.fetch_add(1);
    std::cout << "[ADJUST] master_position_id=" << d.master_position_id
              << " instrument_id=" << d.instrument_id
              << " master_volume=" << d.master_volume
              << " slave_volume=" << existing->slave_volume
              << " close_volume=0 (below lot step " << step << ")\n";
    return;
  }

  const domain::Volume new_slave = VolumeCalculator::roundToStep(
      existing->slave_volume - delta, 0.0);

  domain::OrderRequest request;
  request.kind = domain::OrderKind::ClosePosition;
  request.instrument_id = existing->slave_instrument_id;
  request.side = existing->side;
  request.volume = delta;
  request.linked_position_id = existing->slave_position_id;
  request.label = domain::makeCopyLabel(d.master_position_id);
  report.slave_volume = delta;

  report.outcome = sendWithRetry(request, report.attempts);
  if (!report.outcome.accepted) {
    fail(report, report.outcome.error_kind, report.outcome.message);
    return;
  }

  // The partial close went through even if the entry is gone; the venue is
  // the source of truth and reconciliation restores the pairing.
  if (!recordAdjust(d, new_slave)) {
    report.outcome.message = "ledger entry vanished; reconciliation requested";
  }

  adjusted_.fetch_add(1);
  std::cout << "[ADJUST] master_position_id=" << d.master_position_id
            << " instrument_id=" << d.instrument_id
            << " master_volume=" << d.master_volume
            << " slave_volume=" << new_slave << " close_volume=" << delta
            << "\n";
}

// -----------------------------------------------------------------------------
// recordAdjust(): write the new volumes, or report the vanished entry
// -----------------------------------------------------------------------------
bool OrderDispatcher::recordAdjust(const CopyDecision& d,
                                   domain::Volume new_slave_volume) {
  if (ledger_.adjust(d.master_position_id, d.master_volume,
                     new_slave_volume) == ErrorKind::None) {
    return true;
  }
  std::cerr << "[ERROR] NotFoundError master_position_id="
            << d.master_position_id << " instrument_id=" << d.instrument_id
            << " ledger entry vanished before adjust was recorded\n";
  if (on_reconcile_needed_) {
    on_reconcile_needed_();
  }
  return false;
}

// -----------------------------------------------------------------------------
// sendWithRetry(): rate limit, submit, wait, retry transient failures
// -----------------------------------------------------------------------------
domain::OrderOutcome OrderDispatcher::sendWithRetry(
    domain::OrderRequest request, std::uint32_t& attempts) {
  domain::OrderOutcome outcome;
  outcome.error_kind = ErrorKind::Transport;
  outcome.message = "not sent";

  for (std::uint32_t attempt = 1; attempt <= settings_.max_attempts;
       ++attempt) {
    if (attempt > 1 && !backoff(attempt - 1)) {
      break;
    }
    if (!trade_bucket_.acquire()) {
      outcome.error_kind = ErrorKind::Transport;
      outcome.message = "rate limiter cancelled during shutdown";
      break;
    }

    request.attempt_no = attempt;
    attempts = attempt;

    auto future = gateway_.submitOrder(slave_account_id_, request);
    if (future.wait_for(responseWait()) != std::future_status::ready) {
      outcome = domain::OrderOutcome{};
      outcome.error_kind = ErrorKind::Timeout;
      outcome.message = "no response within request timeout";
    } else {
      try {
        outcome = future.get();
      } catch (const std::future_error& e) {
        outcome = domain::OrderOutcome{};
        outcome.error_kind = ErrorKind::Transport;
        outcome.message = e.what();
      }
    }

    if (outcome.accepted || !isTransient(outcome.error_kind)) {
      return outcome;
    }

    std::cerr << "[OrderDispatcher] " << toString(outcome.error_kind)
              << " on attempt " << attempt << "/" << settings_.max_attempts
              << " label=" << request.label << ": " << outcome.message
              << "\n";
  }
  return outcome;
}

std::optional<double> OrderDispatcher::fetchSlaveBalance() {
  if (!data_bucket_.acquire()) {
    return std::nullopt;
  }
  auto future = gateway_.requestBalance(slave_account_id_);
  if (future.wait_for(responseWait()) != std::future_status::ready) {
    std::cerr << "[OrderDispatcher] balance query timed out for account "
              << slave_account_id_ << "\n";
    return std::nullopt;
  }
  try {
    return future.get();
  } catch (const std::future_error& e) {
    std::cerr << "[OrderDispatcher] balance query failed: " << e.what()
              << "\n";
    return std::nullopt;
  }
}

bool OrderDispatcher::backoff(std::uint32_t failed_attempts) {
  auto delay = settings_.backoff_base;
  for (std::uint32_t i = 1; i < failed_attempts && delay < settings_.backoff_max;
       ++i) {
    delay *= 2;
  }
  delay = std::min(delay, settings_.backoff_max);

  std::unique_lock lock(shutdown_mutex_);
  return !shutdown_cv_.wait_for(lock, delay, [this] { return shuttingDown(); });
}

std::chrono::milliseconds OrderDispatcher::responseWait() const {
  if (!shuttingDown()) {
    return settings_.request_timeout;
  }
  const auto now = toNs(SteadyClock::now());
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::nanoseconds(grace_deadline_ns_.load() - now));
  return std::clamp(remaining, std::chrono::milliseconds(0),
                    settings_.request_timeout);
}

void OrderDispatcher::beginShutdown(std::chrono::milliseconds grace) {
  if (shutting_down_.exchange(true)) {
    return;
  }
  grace_deadline_ns_.store(toNs(SteadyClock::now() + grace));
  {
    // Pairs with the predicate check in backoff(); no lost wakeup.
    std::lock_guard lock(shutdown_mutex_);
  }
  shutdown_cv_.notify_all();
}

void OrderDispatcher::fail(DispatchReportEvent& report, ErrorKind kind,
                           const std::string& message) {
  report.outcome.accepted = false;
  report.outcome.error_kind = kind;
  report.outcome.message = message;
  failed_.fetch_add(1);
  std::cerr << "[ERROR] " << toString(kind)
            << " action=" << toString(report.decision.action)
            << " master_position_id=" << report.decision.master_position_id
            << " instrument_id=" << report.decision.instrument_id
            << " reason=\"" << message << "\"\n";
}

DispatchStats OrderDispatcher::stats() const {
  DispatchStats s;
  s.opened = opened_.load();
  s.adjusted = adjusted_.load();
  s.closed = closed_.load();
  s.skipped = skipped_.load();
  s.failed = failed_.load();
  return s;
}

}  // namespace copier
