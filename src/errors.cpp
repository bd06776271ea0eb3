#include <swa/errors.hpp>

namespace swa {

const char* to_string(WarningKind k) {
  switch (k) {
    case WarningKind::InsufficientTurnEvents: return "InsufficientTurnEvents";
    case WarningKind::MismatchedManualData:   return "MismatchedManualData";
    case WarningKind::DuplicateEvent:         return "DuplicateEvent";
  }
  return "Unknown";
}

} // namespace swa
