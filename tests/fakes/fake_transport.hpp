#pragma once

// =============================================================================
// FakeTransport
// =============================================================================
// Scriptable ITransport for SessionCoordinator and engine tests.
//
// Each session step returns the ErrorKind queued for it (ErrorKind::None when
// nothing is queued), so tests can fail the Nth connect, reject
// authentication, and so on. Position, balance and symbol queries answer
// from per-account tables the test fills in.
//
// Orders are answered immediately on the calling thread: accepted with a
// fresh slave position id unless an outcome is scripted. The fake also adds
// or shrinks the slave position it reports, so a later reconciliation sees
// the venue as it would be.
//
// notify() plays the role of the transport's I/O thread and pushes a
// notification into whatever sink the coordinator installed last.
//
// State is shared through a std::shared_ptr<FakeVenue>, because the
// coordinator takes ownership of the transport itself.
// =============================================================================

#include "copier/session/i_transport.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace copier::fakes {

struct FakeVenue {
  std::mutex mutex;

  std::deque<ErrorKind> connect_results;
  std::deque<ErrorKind> app_auth_results;
  std::deque<ErrorKind> account_auth_results;
  std::deque<ErrorKind> position_query_results;

  std::map<domain::AccountId, std::vector<domain::LivePosition>> positions;
  std::map<domain::AccountId, double> balances;
  std::map<domain::AccountId, std::vector<domain::InstrumentSpec>> symbols;

  std::deque<domain::OrderOutcome> order_script;
  std::vector<std::pair<domain::AccountId, domain::OrderRequest>> orders;
  domain::PositionId next_position_id{5001};

  int connects{0};
  int disconnects{0};
  std::vector<std::vector<domain::InstrumentId>> spot_subscriptions;

  ITransport::NotificationSink sink;

  void notify(TransportNotification notification) {
    ITransport::NotificationSink current;
    {
      std::lock_guard lock(mutex);
      current = sink;
    }
    if (current) {
      current(std::move(notification));
    }
  }

  int connectCount() {
    std::lock_guard lock(mutex);
    return connects;
  }

  std::size_t orderCount() {
    std::lock_guard lock(mutex);
    return orders.size();
  }
};

class FakeTransport : public ITransport {
 public:
  explicit FakeTransport(std::shared_ptr<FakeVenue> venue)
      : venue_(std::move(venue)) {}

  void setNotificationSink(NotificationSink sink) override {
    std::lock_guard lock(venue_->mutex);
    venue_->sink = std::move(sink);
  }

  ErrorKind connect(domain::Environment /*environment*/) override {
    std::lock_guard lock(venue_->mutex);
    ++venue_->connects;
    return next(venue_->connect_results);
  }

  ErrorKind authenticateApplication(const std::string& /*client_id*/,
                                    const std::string& /*secret*/) override {
    std::lock_guard lock(venue_->mutex);
    return next(venue_->app_auth_results);
  }

  ErrorKind authorizeAccount(domain::AccountId /*account_id*/,
                             const std::string& /*token*/) override {
    std::lock_guard lock(venue_->mutex);
    return next(venue_->account_auth_results);
  }

  ErrorKind subscribeExecutionEvents(domain::AccountId /*account_id*/) override {
    return ErrorKind::None;
  }

  ErrorKind subscribeSpots(
      domain::AccountId /*account_id*/,
      const std::vector<domain::InstrumentId>& instrument_ids) override {
    std::lock_guard lock(venue_->mutex);
    venue_->spot_subscriptions.push_back(instrument_ids);
    return ErrorKind::None;
  }

  void sendOrder(domain::AccountId account_id,
                 const domain::OrderRequest& request,
                 OutcomeCallback on_outcome) override {
    domain::OrderOutcome outcome;
    {
      std::lock_guard lock(venue_->mutex);
      venue_->orders.emplace_back(account_id, request);
      if (!venue_->order_script.empty()) {
        outcome = venue_->order_script.front();
        venue_->order_script.pop_front();
      } else {
        outcome.accepted = true;
      }
      if (outcome.accepted) {
        applyToBook(account_id, request, outcome);
      }
    }
    on_outcome(outcome);
  }

  TransportResult<std::vector<domain::LivePosition>> queryOpenPositions(
      domain::AccountId account_id) override {
    std::lock_guard lock(venue_->mutex);
    TransportResult<std::vector<domain::LivePosition>> result;
    result.error = next(venue_->position_query_results);
    if (result.ok()) {
      result.value = venue_->positions[account_id];
    } else {
      result.message = "scripted position query failure";
    }
    return result;
  }

  TransportResult<double> queryBalance(domain::AccountId account_id) override {
    std::lock_guard lock(venue_->mutex);
    TransportResult<double> result;
    auto it = venue_->balances.find(account_id);
    if (it == venue_->balances.end()) {
      result.error = ErrorKind::NotFound;
      result.message = "no balance";
    } else {
      result.value = it->second;
    }
    return result;
  }

  TransportResult<std::vector<domain::InstrumentSpec>> querySymbols(
      domain::AccountId account_id,
      const std::vector<domain::InstrumentId>& /*instrument_ids*/) override {
    std::lock_guard lock(venue_->mutex);
    TransportResult<std::vector<domain::InstrumentSpec>> result;
    result.value = venue_->symbols[account_id];
    return result;
  }

  void disconnect() override {
    std::lock_guard lock(venue_->mutex);
    ++venue_->disconnects;
  }

 private:
  static ErrorKind next(std::deque<ErrorKind>& results) {
    if (results.empty()) {
      return ErrorKind::None;
    }
    const ErrorKind kind = results.front();
    results.pop_front();
    return kind;
  }

  // Keeps the fake slave book in step with accepted orders.
  void applyToBook(domain::AccountId account_id,
                   const domain::OrderRequest& request,
                   domain::OrderOutcome& outcome) {
    auto& book = venue_->positions[account_id];
    if (request.kind == domain::OrderKind::Market) {
      if (!outcome.slave_position_id) {
        outcome.slave_position_id = venue_->next_position_id++;
      }
      domain::LivePosition live;
      live.position_id = *outcome.slave_position_id;
      live.instrument_id = request.instrument_id;
      live.side = request.side;
      live.volume = request.volume;
      live.label = request.label;
      book.push_back(live);
      return;
    }
    if (!request.linked_position_id) {
      return;
    }
    outcome.slave_position_id = request.linked_position_id;
    auto it = std::find_if(book.begin(), book.end(),
                           [&](const domain::LivePosition& p) {
                             return p.position_id == *request.linked_position_id;
                           });
    if (it == book.end()) {
      return;
    }
    it->volume -= request.volume;
    if (it->volume <= domain::kVolumeEpsilon) {
      book.erase(it);
    }
  }

  std::shared_ptr<FakeVenue> venue_;
};

}  // namespace copier::fakes
