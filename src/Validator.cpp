#include "tmux-fleet/Validator.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace fleet {

bool is_instance_name(const std::string &s) {
  if (s.empty() || s.size() > kMaxInstanceNameLength)
    return false;
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return c >= 'a' && c <= 'z'; });
}

Result<std::string> validate_name(const std::string &s) {
  if (!is_instance_name(s)) {
    return make_error(ErrorKind::InvalidInput,
                      "--name must be 1..32 lowercase Latin letters [a-z]");
  }
  return s;
}

Result<Port> validate_port(const std::string &s) {
  auto invalid = [] {
    return make_error(ErrorKind::InvalidInput, "--port must be an integer");
  };

  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    --end;

  // from_chars rejects a leading '+'
  if (begin < end && s[begin] == '+') {
    ++begin;
    if (begin < end && s[begin] == '-')
      return invalid();
  }
  if (begin == end)
    return invalid();

  Port port = 0;
  const char *first = s.data() + begin;
  const char *last = s.data() + end;
  auto [ptr, ec] = std::from_chars(first, last, port);
  if (ec == std::errc::result_out_of_range && ptr == last) {
    return make_error(ErrorKind::InvalidInput,
                      "--port {} is out of range",
                      std::string(first, last));
  }
  if (ec != std::errc() || ptr != last)
    return invalid();
  return port;
}

} // namespace fleet
