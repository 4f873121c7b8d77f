#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>

namespace VectorText {

class Typeface;

// Memoizes BuildGlyphMesh per (face, glyph). Failed builds are remembered
// too and replay their issue on every lookup. Not thread-safe.
class GlyphMeshCache {
public:
  // Returns the cached mesh, or nullptr when the glyph has no mesh.
  auto get(Typeface const& face, uint32_t glyphId, Diagnostics* diagnostics = nullptr) -> GlyphMesh const*;

  auto size() const -> size_t { return entries_.size(); }
  void clear() { entries_.clear(); }

private:
  struct Key {
    uint32_t faceId = 0;
    uint32_t glyphId = 0;

    bool operator==(Key const& other) const {
      return faceId == other.faceId && glyphId == other.glyphId;
    }
  };

  struct KeyHash {
    size_t operator()(Key const& key) const {
      size_t h = static_cast<size_t>(key.faceId);
      h = (h * 1315423911u) ^ static_cast<size_t>(key.glyphId + 0x9e3779b9);
      return h;
    }
  };

  struct Entry {
    std::optional<GlyphMesh> mesh;
    std::optional<Issue> failure;
  };

  std::unordered_map<Key, Entry, KeyHash> entries_;
};

} // namespace VectorText
