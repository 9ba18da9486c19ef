#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace meshgraph::util {

// Standard alphabet with padding. nullopt for malformed input.
std::optional<std::string> DecodeBase64(std::string_view text);

std::string EncodeBase64(std::string_view bytes);

} // namespace meshgraph::util
