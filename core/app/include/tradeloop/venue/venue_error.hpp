#pragma once

#include <stdexcept>
#include <string>

namespace tradeloop {

// -----------------------------------------------------------------------------
// VenueError
// -----------------------------------------------------------------------------
// Thrown by IVenueClient implementations for every collaborator failure:
// transport errors, timeouts, malformed replies, refused orders. Callers in
// the core catch it at task boundaries and log; it is never fatal to the
// orchestrator.
// -----------------------------------------------------------------------------
class VenueError : public std::runtime_error {
 public:
  explicit VenueError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace tradeloop
