#include <pitwall/status.hpp>

namespace pitwall {

const char* to_string(Errc e) {
  switch (e) {
    case Errc::Ok:                   return "ok";
    case Errc::OutOfOrderSample:     return "out_of_order_sample";
    case Errc::InvalidSample:        return "invalid_sample";
    case Errc::InsufficientData:     return "insufficient_data";
    case Errc::InvalidConfiguration: return "invalid_configuration";
    case Errc::UnknownSession:       return "unknown_session";
    case Errc::DuplicateSession:     return "duplicate_session";
    case Errc::SessionClosed:        return "session_closed";
  }
  return "unknown";
}

const char* to_string(DataStatus s) {
  switch (s) {
    case DataStatus::Ok:               return "ok";
    case DataStatus::InsufficientData: return "insufficient_data";
  }
  return "unknown";
}

} // namespace pitwall
