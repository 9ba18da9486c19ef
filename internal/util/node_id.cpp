#include "node_id.hpp"

#include <cstdio>
#include <cstdlib>

namespace meshgraph::util {

std::string FormatNodeId(NodeNum id) {
  char buf[12];
  std::snprintf(buf, sizeof(buf), "!%08x", id);
  return buf;
}

std::optional<NodeNum> ParseNodeId(const std::string& text) {
  if (text.empty()) return std::nullopt;

  const bool        hex    = text[0] == '!';
  const std::string digits = hex ? text.substr(1) : text;
  if (digits.empty() || digits.size() > 10) return std::nullopt;

  char*                    end   = nullptr;
  const unsigned long long value = std::strtoull(digits.c_str(), &end, hex ? 16 : 10);
  if (!end || *end != '\0' || value > 0xFFFFFFFFull) return std::nullopt;

  return static_cast<NodeNum>(value);
}

} // namespace meshgraph::util
