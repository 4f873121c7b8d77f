#include "VectorText/mesh/GlyphMeshBuilder.hpp"
#include "VectorText/text/FontFace.hpp"
#include "VectorText/text/Span.hpp"

#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace VectorText;
using namespace VectorTextTest;

namespace {

auto load_system_face(FontLoader& loader) -> std::shared_ptr<FontFace> {
  auto path = find_system_font_file();
  if (!path) return nullptr;
  return loader.loadFile(path->string());
}

} // namespace

TEST_SUITE_BEGIN("vectortext.font_face");

TEST_CASE("garbage_bytes_are_invalid_font_data") {
  FontLoader loader;
  Diagnostics diagnostics;
  std::vector<uint8_t> bytes{0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};
  CHECK_MESSAGE(loader.loadMemory(bytes, &diagnostics) == nullptr, "no face");
  CHECK_MESSAGE(diagnostics.count(ErrorKind::InvalidFontData) == 1, "invalid font data");
  CHECK_MESSAGE(diagnostics.hasFatal(), "fatal");
}

TEST_CASE("empty_bytes_are_invalid_font_data") {
  FontLoader loader;
  Diagnostics diagnostics;
  CHECK(loader.loadMemory({}, &diagnostics) == nullptr);
  CHECK(diagnostics.count(ErrorKind::InvalidFontData) == 1);
}

TEST_CASE("missing_file_is_invalid_font_data") {
  FontLoader loader;
  Diagnostics diagnostics;
  CHECK(loader.loadFile("/nonexistent/vectortext-font.ttf", &diagnostics) == nullptr);
  CHECK(diagnostics.count(ErrorKind::InvalidFontData) == 1);
}

TEST_CASE("system_font_metrics_and_outlines") {
  FontLoader loader;
  auto face = load_system_face(loader);
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  CHECK_MESSAGE(face->unitsPerEm() > 0, "units per em");
  CHECK_MESSAGE(face->glyphCount() > 0, "glyphs present");
  CHECK_MESSAGE(face->hasNativeContours(), "truetype outlines");
  CHECK_MESSAGE(!ReverseWinding(*face), "native contours keep winding");

  uint32_t glyphA = face->glyphIndex('A');
  REQUIRE(glyphA != 0);
  auto outline = face->outline(glyphA);
  REQUIRE(outline);
  CHECK_MESSAGE(!outline->events.empty(), "outline events");
  CHECK_MESSAGE(outline->events.front().type == OutlineEventType::MoveTo, "starts with a move");
  CHECK_MESSAGE(outline->events.back().type == OutlineEventType::Close, "ends closed");
  CHECK_MESSAGE(outline->bounds.width() > 0.0f, "bounds width");
  CHECK_MESSAGE(outline->bounds.height() > 0.0f, "bounds height");

  CHECK_MESSAGE(!face->outline(face->glyphIndex(' ')), "space has no outline");
}

TEST_CASE("faces_get_distinct_ids") {
  auto path = find_system_font_file();
  if (!path) {
    MESSAGE("no system font found; skipping");
    return;
  }
  FontLoader loader;
  auto first = loader.loadFile(path->string());
  auto second = loader.loadFile(path->string());
  REQUIRE(first);
  REQUIRE(second);
  CHECK(first->id() != second->id());
}

TEST_CASE("face_outlives_loader") {
  std::shared_ptr<FontFace> face;
  {
    FontLoader loader;
    face = load_system_face(loader);
  }
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  CHECK(face->outline(face->glyphIndex('B')));
}

TEST_CASE("system_font_glyph_with_hole_meshes") {
  FontLoader loader;
  auto face = load_system_face(loader);
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  Diagnostics diagnostics;
  auto mesh = BuildGlyphMesh(*face, face->glyphIndex('o'), &diagnostics);
  REQUIRE(mesh);
  CHECK_MESSAGE(!mesh->vertices.empty(), "vertices");
  CHECK_MESSAGE(mesh->indices.size() % 3 == 0, "triangle list");
  CHECK_MESSAGE(indices_in_range(*mesh), "indices in range");
  CHECK_MESSAGE(diagnostics.issues.empty(), "no issues");

  bool hasCurve = false;
  for (auto const& vertex : mesh->vertices) {
    hasCurve = hasCurve || IsCurveVertex(vertex);
  }
  CHECK_MESSAGE(hasCurve, "curve triangles emitted");
}

TEST_CASE("system_font_every_glyph_meshes") {
  FontLoader loader;
  auto face = load_system_face(loader);
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  Diagnostics diagnostics;
  std::vector<uint32_t> failed;
  uint32_t meshed = 0;
  for (uint32_t glyphId = 0; glyphId < face->glyphCount(); ++glyphId) {
    if (!face->outline(glyphId)) continue;
    size_t before = diagnostics.count(ErrorKind::DegenerateGeometry);
    if (BuildGlyphMesh(*face, glyphId, &diagnostics)) {
      ++meshed;
    } else if (diagnostics.count(ErrorKind::DegenerateGeometry) != before && failed.size() < 16) {
      failed.push_back(glyphId);
    }
  }
  std::string failedIds;
  for (uint32_t glyphId : failed) failedIds += std::to_string(glyphId) + " ";
  INFO("first degenerate glyphs: ", failedIds);
  CHECK_MESSAGE(meshed > 0, "outlined glyphs mesh");
  CHECK_MESSAGE(diagnostics.count(ErrorKind::DegenerateGeometry) == 0, "no glyph rejected as degenerate");
}

TEST_CASE("system_font_shaping") {
  FontLoader loader;
  auto face = load_system_face(loader);
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  auto glyphs = face->shape("Hello", nullptr);
  REQUIRE(glyphs);
  REQUIRE(glyphs->size() == 5);
  for (auto const& glyph : *glyphs) {
    CHECK(glyph.glyphId != 0);
    CHECK(glyph.xAdvance > 0);
  }
  CHECK_MESSAGE((*glyphs)[2].glyphId == (*glyphs)[3].glyphId, "both l glyphs match");

  auto empty = face->shape("", nullptr);
  REQUIRE(empty);
  CHECK(empty->empty());
}

TEST_CASE("system_font_hello_world_span") {
  FontLoader loader;
  auto face = load_system_face(loader);
  if (!face) {
    MESSAGE("no system font found; skipping");
    return;
  }
  Diagnostics diagnostics;
  Span span = Span("Hello, World!", face).withFontSize(32.0f);
  auto mesh = span.generateTextMesh(RenderSize{800, 600}, &diagnostics);
  REQUIRE(mesh);
  CHECK_MESSAGE(!mesh->vertices.empty(), "vertices");
  CHECK_MESSAGE(!mesh->indices.empty(), "indices");
  CHECK_MESSAGE(indices_in_range(*mesh), "indices in range");
  CHECK_MESSAGE(!diagnostics.hasFatal(), "no fatal issue");

  auto glyphs = face->shape("Hello, World!", nullptr);
  REQUIRE(glyphs);
  REQUIRE(mesh->glyphOrigins.size() == glyphs->size());
  float expected = 0.0f;
  for (size_t i = 0; i + 1 < glyphs->size(); ++i) {
    expected += static_cast<float>((*glyphs)[i].xAdvance);
  }
  CHECK_MESSAGE(mesh->glyphOrigins.back().x == doctest::Approx(expected), "last glyph after preceding advances");
}

TEST_SUITE_END();
