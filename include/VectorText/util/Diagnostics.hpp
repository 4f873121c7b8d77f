#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace VectorText {

enum class ErrorKind : uint8_t {
  GlyphNotFound = 0,
  DegenerateGeometry = 1,
  IndexOverflow = 2,
  InvalidFontData = 3,
  ShapingFailure = 4,
};

constexpr size_t ErrorKindCount = static_cast<size_t>(ErrorKind::ShapingFailure) + 1u;

constexpr auto errorKindName(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::GlyphNotFound:
      return "GlyphNotFound";
    case ErrorKind::DegenerateGeometry:
      return "DegenerateGeometry";
    case ErrorKind::IndexOverflow:
      return "IndexOverflow";
    case ErrorKind::InvalidFontData:
      return "InvalidFontData";
    case ErrorKind::ShapingFailure:
      return "ShapingFailure";
  }
  return "UnknownErrorKind";
}

constexpr auto errorKindFromName(std::string_view name, ErrorKind& out) -> bool {
  for (size_t kindIndex = 0; kindIndex < ErrorKindCount; ++kindIndex) {
    if (errorKindName(static_cast<ErrorKind>(kindIndex)) == name) {
      out = static_cast<ErrorKind>(kindIndex);
      return true;
    }
  }
  return false;
}

// Face-level and shaping-level failures abort the caller; glyph-level ones
// only drop the glyph.
constexpr auto IsFatal(ErrorKind kind) -> bool {
  return kind == ErrorKind::InvalidFontData || kind == ErrorKind::ShapingFailure;
}

struct Issue {
  ErrorKind kind{ErrorKind::GlyphNotFound};
  uint32_t glyphId = 0;
  std::string detail;
};

struct Diagnostics {
  std::vector<Issue> issues;

  void clear() {
    issues.clear();
  }

  void add(ErrorKind kind, uint32_t glyphId, std::string detail) {
    issues.push_back(Issue{kind, glyphId, std::move(detail)});
  }

  bool hasFatal() const {
    for (auto const& issue : issues) {
      if (IsFatal(issue.kind)) return true;
    }
    return false;
  }

  auto count(ErrorKind kind) const -> size_t {
    size_t n = 0;
    for (auto const& issue : issues) {
      if (issue.kind == kind) ++n;
    }
    return n;
  }

  auto last() const -> Issue const* {
    return issues.empty() ? nullptr : &issues.back();
  }
};

inline void Report(Diagnostics* diagnostics, ErrorKind kind, uint32_t glyphId, std::string detail) {
  if (!diagnostics) return;
  diagnostics->add(kind, glyphId, std::move(detail));
}

} // namespace VectorText
