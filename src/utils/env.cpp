#include "enginebridge/utils/env.hpp"

#include <cstdlib>
#include <string_view>

namespace enginebridge::utils {
namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string_view value(raw);
  const auto first = value.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return std::string();
  }
  const auto last = value.find_last_not_of(kWhitespace);
  return std::string(value.substr(first, last - first + 1));
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  auto value = read_env(name);
  return value ? *value : fallback;
}

}  // namespace enginebridge::utils
