#pragma once

// =============================================================================
// FakeTradeGateway
// =============================================================================
// In-memory ITradeGateway for dispatcher and pipeline tests.
//
// Outcomes are scripted per call: push them with script(); once the script is
// empty every order is accepted and gets the next slave position id. Calls
// are recorded so tests can inspect exactly what was sent.
//
// onSubmit() runs a hook on the calling thread before each order is answered,
// for tests that change shared state while an order is in flight.
//
// hold() makes the gateway return futures that never complete, for timeout
// and shutdown tests.
// =============================================================================

#include "copier/dispatch/i_trade_gateway.hpp"

#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace copier::fakes {

class FakeTradeGateway : public ITradeGateway {
 public:
  std::future<domain::OrderOutcome> submitOrder(
      domain::AccountId account_id,
      const domain::OrderRequest& request) override {
    std::function<void(const domain::OrderRequest&)> hook;
    {
      std::lock_guard lock(mutex_);
      hook = on_submit_;
    }
    if (hook) {
      hook(request);
    }

    std::lock_guard lock(mutex_);
    requests_.push_back(request);
    last_account_ = account_id;

    std::promise<domain::OrderOutcome> promise;
    auto future = promise.get_future();
    if (held_) {
      parked_.push_back(std::move(promise));
      return future;
    }

    domain::OrderOutcome outcome;
    if (!script_.empty()) {
      outcome = script_.front();
      script_.pop_front();
    } else {
      outcome.accepted = true;
    }
    if (outcome.accepted && !outcome.slave_position_id) {
      outcome.slave_position_id =
          request.linked_position_id ? *request.linked_position_id
                                     : next_position_id_++;
    }
    promise.set_value(outcome);
    return future;
  }

  std::future<std::optional<double>> requestBalance(
      domain::AccountId /*account_id*/) override {
    std::lock_guard lock(mutex_);
    ++balance_queries_;
    std::promise<std::optional<double>> promise;
    promise.set_value(balance_);
    return promise.get_future();
  }

  void script(domain::OrderOutcome outcome) {
    std::lock_guard lock(mutex_);
    script_.push_back(std::move(outcome));
  }

  void scriptError(ErrorKind kind, const std::string& message = "scripted") {
    domain::OrderOutcome outcome;
    outcome.error_kind = kind;
    outcome.message = message;
    script(outcome);
  }

  void setBalance(std::optional<double> balance) {
    std::lock_guard lock(mutex_);
    balance_ = balance;
  }

  void onSubmit(std::function<void(const domain::OrderRequest&)> hook) {
    std::lock_guard lock(mutex_);
    on_submit_ = std::move(hook);
  }

  void hold() {
    std::lock_guard lock(mutex_);
    held_ = true;
  }

  std::vector<domain::OrderRequest> requests() const {
    std::lock_guard lock(mutex_);
    return requests_;
  }

  std::size_t requestCount() const {
    std::lock_guard lock(mutex_);
    return requests_.size();
  }

  int balanceQueries() const {
    std::lock_guard lock(mutex_);
    return balance_queries_;
  }

  domain::AccountId lastAccount() const {
    std::lock_guard lock(mutex_);
    return last_account_;
  }

 private:
  mutable std::mutex mutex_;
  std::deque<domain::OrderOutcome> script_;
  std::vector<domain::OrderRequest> requests_;
  std::vector<std::promise<domain::OrderOutcome>> parked_;
  std::function<void(const domain::OrderRequest&)> on_submit_;
  std::optional<double> balance_;
  domain::PositionId next_position_id_{9001};
  domain::AccountId last_account_{0};
  int balance_queries_{0};
  bool held_{false};
};

}  // namespace copier::fakes
