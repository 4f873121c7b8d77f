#pragma once

#include <string_view>

#include <spdlog/spdlog.h>

namespace VectorText {

// Applies VECTORTEXT_LOG_LEVEL (trace|debug|info|warn|error|critical|off) to
// spdlog's default logger. Unset or unknown values fall back to `info`.
void InitLogging();

auto ParseLogLevel(std::string_view name) -> spdlog::level::level_enum;

} // namespace VectorText
