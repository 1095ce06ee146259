#pragma once

#include <optional>
#include <stdexcept>
#include <string>

enum class TransferError {
  None,
  LocationNotFound,
  AmbiguousDestination,
  NoMatchOrFull,
  CapabilityMissing,
  TransferFailed,
  DirectoryUnavailable
};

inline const char* to_string(TransferError error) {
  switch(error) {
    case TransferError::None: return "none";
    case TransferError::LocationNotFound: return "location_not_found";
    case TransferError::AmbiguousDestination: return "ambiguous_destination";
    case TransferError::NoMatchOrFull: return "no_match_or_full";
    case TransferError::CapabilityMissing: return "capability_missing";
    case TransferError::TransferFailed: return "transfer_failed";
    case TransferError::DirectoryUnavailable: return "directory_unavailable";
  }
  return "unknown";
}

// Raised only in strict mode, where a soft failure becomes a hard stop.
class TransferFault : public std::runtime_error {
public:
  TransferFault(TransferError kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  TransferError kind() const { return kind_; }

private:
  TransferError kind_;
};

// Result of move() and query_balance(): a count plus an optional message.
// Partial success carries no error.
struct MoveResult {
  int transferred = 0;
  std::optional<std::string> error;
  TransferError kind = TransferError::None;

  bool ok() const { return !error.has_value(); }

  static MoveResult success(int transferred) {
    MoveResult result;
    result.transferred = transferred;
    return result;
  }

  static MoveResult failure(TransferError kind, std::string message) {
    MoveResult result;
    result.kind = kind;
    result.error = std::move(message);
    return result;
  }
};
