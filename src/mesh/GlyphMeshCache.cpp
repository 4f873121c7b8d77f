#include "VectorText/mesh/GlyphMeshCache.hpp"
#include "VectorText/mesh/GlyphMeshBuilder.hpp"
#include "VectorText/text/Typeface.hpp"

#include <utility>

namespace VectorText {

auto GlyphMeshCache::get(Typeface const& face, uint32_t glyphId, Diagnostics* diagnostics) -> GlyphMesh const* {
  Key key{face.id(), glyphId};
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    Diagnostics local;
    Entry entry;
    entry.mesh = BuildGlyphMesh(face, glyphId, &local);
    if (auto const* issue = local.last()) {
      entry.failure = *issue;
    }
    it = entries_.emplace(key, std::move(entry)).first;
  }
  Entry const& entry = it->second;
  if (entry.failure) {
    Report(diagnostics, entry.failure->kind, entry.failure->glyphId, entry.failure->detail);
  }
  return entry.mesh ? &*entry.mesh : nullptr;
}

} // namespace VectorText
