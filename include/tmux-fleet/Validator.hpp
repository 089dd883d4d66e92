#pragma once

#include "tmux-fleet/Result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace fleet {

using Port = std::int64_t;

constexpr std::size_t kMaxInstanceNameLength = 32;

/// True iff s is 1..32 lowercase Latin letters
bool is_instance_name(const std::string &s);

/// Accepts names matching ^[a-z]{1,32}$
Result<std::string> validate_name(const std::string &s);

/// Accepts any decimal integer that fits in 64 bits; larger ones get their
/// own "out of range" message. The port range is left to bind() in the
/// instance.
Result<Port> validate_port(const std::string &s);

} // namespace fleet
