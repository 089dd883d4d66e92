#include "tmux-fleet/Result.hpp"

namespace fleet {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidInput:
    return "InvalidInput";
  case ErrorKind::PreconditionFailed:
    return "PreconditionFailed";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::ExternalToolError:
    return "ExternalToolError";
  case ErrorKind::IOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

} // namespace fleet
