#include "copier/session/session_coordinator.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>
#include <utility>

namespace copier {

namespace {

// How long the idle coordinator waits for a command before re-checking its
// stop flag.
constexpr auto kCommandWait = std::chrono::milliseconds(20);

template <typename T>
void fulfil(const std::shared_ptr<std::promise<T>>& promise, T value) {
  try {
    promise->set_value(std::move(value));
  } catch (const std::future_error& e) {
    std::cerr << "[SessionCoordinator] response delivered twice: " << e.what()
              << "\n";
  }
}

domain::OrderOutcome failedOutcome(ErrorKind kind, std::string message) {
  domain::OrderOutcome outcome;
  outcome.error_kind = kind;
  outcome.message = std::move(message);
  return outcome;
}

}  // namespace

SessionCoordinator::SessionCoordinator(std::unique_ptr<ITransport> transport,
                                       SessionSettings settings,
                                       const SymbolMapper& mapper,
                                       SymbolCatalog& catalog,
                                       PositionLedger& ledger,
                                       const LedgerReconciler& reconciler,
                                       SessionCallbacks callbacks)
    : transport_(std::move(transport)),
      settings_(std::move(settings)),
      mapper_(mapper),
      catalog_(catalog),
      ledger_(ledger),
      reconciler_(reconciler),
      callbacks_(std::move(callbacks)) {}

SessionCoordinator::~SessionCoordinator() { stop(); }

void SessionCoordinator::start() {
  if (thread_.joinable()) {
    return;
  }
  fatal_.store(false);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void SessionCoordinator::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(state_mutex_);
    running_.store(false);
  }
  state_cv_.notify_all();
  thread_.join();

  failQueued();
  transport_->disconnect();
  setState(SessionState::Disconnected);
  std::cout << "[SessionCoordinator] stopped.\n";
}

bool SessionCoordinator::waitForState(SessionState target,
                                      std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_mutex_);
  state_cv_.wait_for(lock, timeout, [&] {
    return state_.load() == target || fatal_.load();
  });
  return state_.load() == target;
}

void SessionCoordinator::requestReconciliation() {
  commands_.push(ReconcileCommand{});
}

std::future<domain::OrderOutcome> SessionCoordinator::submitOrder(
    domain::AccountId account_id, const domain::OrderRequest& request) {
  auto promise = std::make_shared<std::promise<domain::OrderOutcome>>();
  auto future = promise->get_future();
  commands_.push(OrderSubmission{account_id, request,
                                 std::chrono::steady_clock::now(),
                                 std::move(promise)});
  return future;
}

std::future<std::optional<double>> SessionCoordinator::requestBalance(
    domain::AccountId account_id) {
  auto promise = std::make_shared<std::promise<std::optional<double>>>();
  auto future = promise->get_future();
  commands_.push(BalanceQuery{account_id, std::move(promise)});
  return future;
}

// -----------------------------------------------------------------------------
// run(): reconnect when disconnected, otherwise serve commands
// -----------------------------------------------------------------------------
void SessionCoordinator::run() {
  std::uint32_t failures = 0;

  while (running_.load()) {
    if (state_.load() == SessionState::Disconnected) {
      if (failures > 0 && !waitBackoff(failures)) {
        break;
      }
      const ErrorKind result = establishSession();
      if (result == ErrorKind::None) {
        failures = 0;
        continue;
      }
      enterDisconnected(toString(result));
      if (!running_.load()) {
        break;
      }
      if (result == ErrorKind::Auth) {
        declareFatal("authentication rejected");
        break;
      }
      if (++failures >= settings_.max_reconnect_attempts) {
        declareFatal("reconnect attempts exhausted");
        break;
      }
      continue;
    }

    if (auto command = commands_.pop_for(kCommandWait)) {
      handle(std::move(*command));
    }
  }
}

// -----------------------------------------------------------------------------
// establishSession(): connect, authenticate, subscribe, rebuild, run
// -----------------------------------------------------------------------------
ErrorKind SessionCoordinator::establishSession() {
  const std::uint64_t epoch = epoch_.fetch_add(1) + 1;
  transport_->setNotificationSink([this, epoch](TransportNotification n) {
    commands_.push(InboundNotification{epoch, std::move(n)});
  });

  setState(SessionState::Connecting);
  std::cout << "[SessionCoordinator] connecting to "
            << domain::toString(settings_.environment) << " (epoch " << epoch
            << ")\n";

  ErrorKind err = transport_->connect(settings_.environment);
  if (err != ErrorKind::None) {
    return err;
  }

  err = transport_->authenticateApplication(settings_.client_id,
                                            settings_.client_secret);
  if (err != ErrorKind::None) {
    return err;
  }
  setState(SessionState::AppAuthenticated);

  for (const AccountCredentials* account : {&settings_.master, &settings_.slave}) {
    err = transport_->authorizeAccount(account->account_id,
                                       account->access_token);
    if (err != ErrorKind::None) {
      return err;
    }
  }
  setState(SessionState::AccountsAuthorized);

  err = transport_->subscribeExecutionEvents(settings_.master.account_id);
  if (err != ErrorKind::None) {
    return err;
  }
  const auto master_ids = mapper_.instruments(domain::Broker::Master);
  if (!master_ids.empty()) {
    err = transport_->subscribeSpots(settings_.master.account_id, master_ids);
    if (err != ErrorKind::None) {
      return err;
    }
  }
  const auto slave_ids = slaveInstruments();
  if (!slave_ids.empty()) {
    err = transport_->subscribeSpots(settings_.slave.account_id, slave_ids);
    if (err != ErrorKind::None) {
      return err;
    }
  }
  setState(SessionState::Subscribed);

  if (callbacks_.on_new_epoch) {
    callbacks_.on_new_epoch();
  }
  loadInstrumentSpecs();

  std::vector<CopyDecision> opens;
  err = rebuildLedger(true, opens);
  if (err != ErrorKind::None) {
    return err;
  }

  setState(SessionState::Running);
  std::cout << "[SessionCoordinator] RUNNING. master=" << settings_.master.account_id
            << " slave=" << settings_.slave.account_id
            << " ledger=" << ledger_.size() << "\n";
  emitOpens(opens);
  return ErrorKind::None;
}

void SessionCoordinator::enterDisconnected(const std::string& reason) {
  std::cerr << "[SessionCoordinator] session lost in state "
            << toString(state_.load()) << ": " << reason << "\n";
  transport_->disconnect();
  setState(SessionState::Disconnected);
}

void SessionCoordinator::declareFatal(const std::string& reason) {
  std::cerr << "[SessionCoordinator] FATAL: " << reason << "\n";
  {
    std::lock_guard lock(state_mutex_);
    fatal_.store(true);
  }
  state_cv_.notify_all();
}

bool SessionCoordinator::waitBackoff(std::uint32_t failures) {
  auto delay = settings_.reconnect_backoff_base;
  for (std::uint32_t i = 1; i < failures && delay < settings_.reconnect_backoff_max;
       ++i) {
    delay *= 2;
  }
  delay = std::min(delay, settings_.reconnect_backoff_max);

  std::cout << "[SessionCoordinator] reconnect attempt " << failures + 1
            << "/" << settings_.max_reconnect_attempts << " in "
            << delay.count() << " ms\n";

  std::unique_lock lock(state_mutex_);
  return !state_cv_.wait_for(lock, delay, [this] { return !running_.load(); });
}

// -----------------------------------------------------------------------------
// rebuildLedger(): pair live positions on both accounts
// -----------------------------------------------------------------------------
// full == true replaces the ledger (session start). full == false only adds
// pairs for positions the ledger does not know yet (out-of-band request).
// -----------------------------------------------------------------------------
ErrorKind SessionCoordinator::rebuildLedger(bool full,
                                            std::vector<CopyDecision>& opens) {
  auto master = transport_->queryOpenPositions(settings_.master.account_id);
  if (!master.ok()) {
    std::cerr << "[SessionCoordinator] master position query failed: "
              << master.message << "\n";
    return master.error;
  }
  auto slave = transport_->queryOpenPositions(settings_.slave.account_id);
  if (!slave.ok()) {
    std::cerr << "[SessionCoordinator] slave position query failed: "
              << slave.message << "\n";
    return slave.error;
  }

  if (!full) {
    std::unordered_set<domain::PositionId> linked_slaves;
    for (const auto& pos : ledger_.snapshot()) {
      if (pos.slave_position_id) {
        linked_slaves.insert(*pos.slave_position_id);
      }
    }
    auto& m = master.value;
    m.erase(std::remove_if(m.begin(), m.end(),
                           [this](const domain::LivePosition& p) {
                             return ledger_.contains(p.position_id);
                           }),
            m.end());
    auto& s = slave.value;
    s.erase(std::remove_if(s.begin(), s.end(),
                           [&](const domain::LivePosition& p) {
                             return linked_slaves.count(p.position_id) != 0;
                           }),
            s.end());
  }

  ReconcileResult result = reconciler_.reconcile(master.value, slave.value);

  std::size_t installed = result.paired.size();
  if (full) {
    ledger_.replaceAll(result.paired);
  } else {
    installed = ledger_.merge(result.paired);
  }

  for (const auto& unpaired : result.unpaired_master) {
    CopyDecision open;
    open.action = CopyAction::Open;
    open.reason = DecisionReason::Reconciliation;
    open.instrument_id = unpaired.instrument_id;
    open.master_position_id = unpaired.position_id;
    open.side = unpaired.side;
    open.master_volume = unpaired.volume;
    open.opened_at_ms = unpaired.opened_at_ms;
    opens.push_back(open);
  }

  std::cerr << "[SessionCoordinator] WARNING: ledger "
            << (full ? "rebuilt" : "reconciled") << ": paired=" << installed
            << " (by label " << result.label_matches << ")"
            << " unpaired_master=" << result.unpaired_master.size()
            << " orphan_slave=" << result.orphan_slave.size() << "\n";
  return ErrorKind::None;
}

void SessionCoordinator::loadInstrumentSpecs() {
  const auto master_ids = mapper_.instruments(domain::Broker::Master);
  const auto slave_ids = slaveInstruments();

  auto load = [this](domain::Broker broker, domain::AccountId account,
                     const std::vector<domain::InstrumentId>& ids) {
    if (ids.empty()) {
      return;
    }
    auto specs = transport_->querySymbols(account, ids);
    if (!specs.ok()) {
      std::cerr << "[SessionCoordinator] symbol query for "
                << domain::toString(broker) << " failed (" << specs.message
                << "); keeping configured specs.\n";
      return;
    }
    for (const auto& spec : specs.value) {
      catalog_.upsert(broker, spec);
    }
  };

  load(domain::Broker::Master, settings_.master.account_id, master_ids);
  load(domain::Broker::Slave, settings_.slave.account_id, slave_ids);
}

void SessionCoordinator::emitOpens(const std::vector<CopyDecision>& opens) {
  if (!callbacks_.on_open_decision) {
    return;
  }
  for (const auto& open : opens) {
    callbacks_.on_open_decision(open);
  }
}

// -----------------------------------------------------------------------------
// handle(): dispatch one command on the coordinator thread
// -----------------------------------------------------------------------------
void SessionCoordinator::handle(CoordinatorCommand command) {
  if (auto* inbound = std::get_if<InboundNotification>(&command)) {
    handleNotification(*inbound);
  } else if (auto* order = std::get_if<OrderSubmission>(&command)) {
    handleOrder(*order);
  } else if (auto* balance = std::get_if<BalanceQuery>(&command)) {
    handleBalance(*balance);
  } else if (std::holds_alternative<ReconcileCommand>(command)) {
    if (state_.load() != SessionState::Running) {
      return;
    }
    std::vector<CopyDecision> opens;
    const ErrorKind err = rebuildLedger(false, opens);
    if (err != ErrorKind::None) {
      enterDisconnected(std::string("reconciliation failed: ") + toString(err));
      return;
    }
    emitOpens(opens);
  }
}

void SessionCoordinator::handleNotification(InboundNotification& inbound) {
  if (inbound.epoch != epoch_.load()) {
    return;  // From a previous connection
  }

  if (auto* event = std::get_if<ExecutionEvent>(&inbound.notification)) {
    if (event->account_id != settings_.master.account_id) {
      return;
    }
    if (state_.load() != SessionState::Running) {
      std::cerr << "[SessionCoordinator] dropped execution event outside "
                   "RUNNING, master_position_id="
                << event->master_position_id << "\n";
      return;
    }
    if (callbacks_.on_execution) {
      callbacks_.on_execution(*event);
    }
  } else if (auto* spot = std::get_if<SpotEvent>(&inbound.notification)) {
    const domain::Broker broker = spot->account_id == settings_.master.account_id
                                      ? domain::Broker::Master
                                      : domain::Broker::Slave;
    catalog_.updateQuote(broker, spot->instrument_id, spot->bid, spot->ask);
  } else if (auto* lost = std::get_if<TransportLost>(&inbound.notification)) {
    if (state_.load() != SessionState::Disconnected) {
      enterDisconnected(lost->reason);
    }
  }
}

void SessionCoordinator::handleOrder(OrderSubmission& submission) {
  if (std::chrono::steady_clock::now() - submission.submitted_at >
      settings_.order_stale_after) {
    fulfil(submission.promise,
           failedOutcome(ErrorKind::Timeout, "request expired before sending"));
    return;
  }
  if (state_.load() != SessionState::Running) {
    fulfil(submission.promise,
           failedOutcome(ErrorKind::Transport, "session not running"));
    return;
  }
  auto promise = submission.promise;
  transport_->sendOrder(submission.account_id, submission.request,
                        [promise](domain::OrderOutcome outcome) {
                          fulfil(promise, std::move(outcome));
                        });
}

void SessionCoordinator::handleBalance(BalanceQuery& query) {
  if (state_.load() != SessionState::Running) {
    fulfil(query.promise, std::optional<double>{});
    return;
  }
  auto result = transport_->queryBalance(query.account_id);
  if (!result.ok()) {
    std::cerr << "[SessionCoordinator] balance query failed: "
              << result.message << "\n";
    fulfil(query.promise, std::optional<double>{});
    return;
  }
  fulfil(query.promise, std::optional<double>{result.value});
}

void SessionCoordinator::failQueued() {
  for (auto& command : commands_.drain()) {
    if (auto* order = std::get_if<OrderSubmission>(&command)) {
      fulfil(order->promise,
             failedOutcome(ErrorKind::Transport, "session stopped"));
    } else if (auto* balance = std::get_if<BalanceQuery>(&command)) {
      fulfil(balance->promise, std::optional<double>{});
    }
  }
}

void SessionCoordinator::setState(SessionState state) {
  {
    std::lock_guard lock(state_mutex_);
    state_.store(state);
  }
  state_cv_.notify_all();
}

std::vector<domain::InstrumentId> SessionCoordinator::slaveInstruments() const {
  std::vector<domain::InstrumentId> ids;
  for (auto master_id : mapper_.instruments(domain::Broker::Master)) {
    if (auto slave_id = mapper_.resolve(master_id, domain::Broker::Master,
                                        domain::Broker::Slave)) {
      ids.push_back(*slave_id);
    }
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

}  // namespace copier
