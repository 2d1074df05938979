#pragma once

#include "copier/domain/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace copier {

// Session lifecycle. Only RUNNING forwards master events to the workers.
enum class SessionState {
  Disconnected,
  Connecting,
  AppAuthenticated,
  AccountsAuthorized,
  Subscribed,
  Running,
};

inline const char* toString(SessionState state) {
  switch (state) {
    case SessionState::Disconnected:       return "DISCONNECTED";
    case SessionState::Connecting:         return "CONNECTING";
    case SessionState::AppAuthenticated:   return "APP_AUTHENTICATED";
    case SessionState::AccountsAuthorized: return "ACCOUNTS_AUTHORIZED";
    case SessionState::Subscribed:         return "SUBSCRIBED";
    case SessionState::Running:            return "RUNNING";
  }
  return "UNKNOWN";
}

struct AccountCredentials {
  domain::AccountId account_id{0};
  std::string access_token;
};

struct SessionSettings {
  domain::Environment environment{domain::Environment::Demo};
  std::string client_id;
  std::string client_secret;
  AccountCredentials master;
  AccountCredentials slave;

  // Consecutive failed session attempts before the session is declared
  // fatal. The count resets once RUNNING is reached.
  std::uint32_t max_reconnect_attempts{10};
  std::chrono::milliseconds reconnect_backoff_base{5'000};
  std::chrono::milliseconds reconnect_backoff_max{300'000};

  // Order submissions older than this when the coordinator gets to them are
  // answered with Timeout instead of being sent; the dispatcher has given up
  // on them by then.
  std::chrono::milliseconds order_stale_after{5'000};
};

}  // namespace copier
