#pragma once

namespace copier {

// -----------------------------------------------------------------------------
// ErrorKind
// -----------------------------------------------------------------------------
//
// @brief  Error taxonomy shared by the ledger, dispatcher, and session layer.
//
// @details
// Errors travel as values (return codes and fields on outcome structs). Each
// component logs the errors it originates and contains them; only Auth and an
// exhausted reconnect budget end the session.
//
//   Transport      connection lost or request could not be written
//   Timeout        no response within the request timeout
//   RateLimited    venue-side rate limiter rejected the request
//   Auth           bad credentials or expired token (fatal)
//   NotFound       position or symbol absent
//   DuplicateKey   a second OPEN for a live master position
//   RejectedOrder  business rejection (volume, margin, symbol)
//   PolicyFallback pip data missing; global multiplier used instead
// -----------------------------------------------------------------------------
enum class ErrorKind {
  None,
  Transport,
  Timeout,
  RateLimited,
  Auth,
  NotFound,
  DuplicateKey,
  RejectedOrder,
  PolicyFallback,
};

inline const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:           return "None";
    case ErrorKind::Transport:      return "TransportError";
    case ErrorKind::Timeout:        return "TimeoutError";
    case ErrorKind::RateLimited:    return "RateLimitedError";
    case ErrorKind::Auth:           return "AuthError";
    case ErrorKind::NotFound:       return "NotFoundError";
    case ErrorKind::DuplicateKey:   return "DuplicateKeyError";
    case ErrorKind::RejectedOrder:  return "RejectedOrderError";
    case ErrorKind::PolicyFallback: return "PolicyFallbackWarning";
  }
  return "Unknown";
}

// Transient failures are worth another attempt after backoff; everything
// else is a definitive answer.
inline bool isTransient(ErrorKind kind) {
  return kind == ErrorKind::Transport || kind == ErrorKind::Timeout ||
         kind == ErrorKind::RateLimited;
}

}  // namespace copier
