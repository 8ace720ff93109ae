#pragma once

namespace pitwall {

enum class Errc {
  Ok,
  OutOfOrderSample,     // timestamp or lap went backwards
  InvalidSample,        // non-finite or out-of-range field
  InsufficientData,
  InvalidConfiguration,
  UnknownSession,
  DuplicateSession,
  SessionClosed,
};

// Per-snapshot availability. InsufficientData must be rendered distinctly by
// consumers; numeric fields of such a snapshot are not meaningful.
enum class DataStatus { Ok, InsufficientData };

const char* to_string(Errc e);
const char* to_string(DataStatus s);

} // namespace pitwall
