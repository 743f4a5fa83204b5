#include "futmon/errors/exchange_error.hpp"
#include "futmon/errors/fetch_result.hpp"
#include "futmon/time/time_utils.hpp"

namespace futmon {

const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Auth:      return "Auth";
    case ErrorKind::RateLimit: return "RateLimit";
    case ErrorKind::Transient: return "Transient";
    case ErrorKind::Protocol:  return "Protocol";
  }
  return "Unknown";
}

const char* dataStateToString(DataState state) {
  switch (state) {
    case DataState::Fresh:       return "fresh";
    case DataState::Stale:       return "stale";
    case DataState::Unavailable: return "unavailable";
  }
  return "unknown";
}

std::string describeResult(DataState state, std::int64_t age_ms,
                           const std::optional<FetchError>& error) {
  std::string out = dataStateToString(state);
  if (state == DataState::Fresh) {
    return out;
  }

  out += " (";
  if (state == DataState::Stale) {
    out += "age " + format_age(age_ms);
    if (error) {
      out += ", ";
    }
  }
  if (error) {
    out += errorKindToString(error->kind);
    out += ": ";
    out += error->message;
  } else if (state == DataState::Stale) {
    out += ", refresh in flight";
  }
  out += ")";
  return out;
}

}  // namespace futmon
