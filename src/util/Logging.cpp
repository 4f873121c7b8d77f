#include "VectorText/util/Logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace VectorText {

namespace {

auto to_lower(std::string_view text) -> std::string {
  std::string out{text};
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

auto ParseLogLevel(std::string_view name) -> spdlog::level::level_enum {
  auto lowered = to_lower(name);
  if (lowered == "trace") return spdlog::level::trace;
  if (lowered == "debug") return spdlog::level::debug;
  if (lowered == "info") return spdlog::level::info;
  if (lowered == "warn" || lowered == "warning") return spdlog::level::warn;
  if (lowered == "error") return spdlog::level::err;
  if (lowered == "critical") return spdlog::level::critical;
  if (lowered == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void InitLogging() {
  auto level = spdlog::level::info;
  if (auto env = std::getenv("VECTORTEXT_LOG_LEVEL")) {
    level = ParseLogLevel(env);
  }
  spdlog::set_level(level);
  spdlog::debug("log level set to {}", spdlog::level::to_string_view(level));
}

} // namespace VectorText
