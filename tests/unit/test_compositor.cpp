#include "VectorText/renderer/Compositor.hpp"

#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

using namespace VectorText;
using namespace VectorTextTest;

namespace {

auto make_face() -> std::shared_ptr<FakeTypeface> {
  auto face = std::make_shared<FakeTypeface>(1000, true);
  face->addSquareGlyphs("abcdefgh");
  return face;
}

constexpr Color Black{0.0f, 0.0f, 0.0f, 1.0f};
constexpr Color Red{1.0f, 0.0f, 0.0f, 1.0f};
constexpr Color Blue{0.0f, 0.0f, 1.0f, 1.0f};

struct RecordingBackend final : RasterBackend {
  uint32_t calls = 0;
  size_t vertexCount = 0;
  size_t indexCount = 0;
  std::vector<Color> palette;
  std::vector<float> offsets;
  uint32_t instanceCount = 0;
  RenderSize renderSize{};
  Color clearColor{};

  auto draw(DrawRequest const& request, Diagnostics*) -> std::optional<Image> override {
    ++calls;
    vertexCount = request.vertices.size();
    indexCount = request.indices.size();
    palette.assign(request.palette.begin(), request.palette.end());
    offsets.assign(request.subpixelOffsets.begin(), request.subpixelOffsets.end());
    instanceCount = request.instanceCount;
    renderSize = request.renderSize;
    clearColor = request.clearColor;
    return MakeImage(request.renderSize.width, request.renderSize.height, Rgba8{});
  }
};

} // namespace

TEST_SUITE_BEGIN("vectortext.compositor");

TEST_CASE("palette_index_deduplicates") {
  std::vector<Color> palette;
  CHECK(PaletteIndex(palette, Black) == 0u);
  CHECK(PaletteIndex(palette, Red) == 1u);
  CHECK(PaletteIndex(palette, Black) == 0u);
  CHECK(PaletteIndex(palette, Blue) == 2u);
  CHECK_MESSAGE(palette.size() == 3, "one entry per distinct color");
}

TEST_CASE("same_color_spans_share_one_entry") {
  auto face = make_face();
  Compositor compositor(RenderSize{400, 300});
  compositor.add(Span("abc", face));
  compositor.add(Span("def", face).withPosition(Point2D{0.0f, 100.0f}));
  auto batch = compositor.compose();
  REQUIRE(batch);
  CHECK_MESSAGE(batch->palette.size() == 1, "palette deduplicated");
  CHECK_MESSAGE((batch->palette[0] == Black), "default color");
  for (auto const& vertex : batch->vertices) {
    CHECK(vertex.paletteIndex == 0u);
  }
  CHECK_MESSAGE(batch->vertices.size() == 6 * 4, "every glyph batched");
}

TEST_CASE("palette_entries_resolve_to_span_colors") {
  auto face = make_face();
  Compositor compositor;
  compositor.add(Span("ab", face).withColor(Red));
  compositor.add(Span("cd", face).withColor(Blue));
  compositor.add(Span("ef", face).withColor(Red));
  compositor.add(Span("gh", face));
  auto batch = compositor.compose();
  REQUIRE(batch);
  REQUIRE(batch->palette.size() == 3);

  std::vector<Color> expected{Red, Red, Red, Red, Red, Red, Red, Red,
                              Blue, Blue, Blue, Blue, Blue, Blue, Blue, Blue,
                              Red, Red, Red, Red, Red, Red, Red, Red,
                              Black, Black, Black, Black, Black, Black, Black, Black};
  REQUIRE(batch->vertices.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    REQUIRE(batch->vertices[i].paletteIndex < batch->palette.size());
    CHECK((batch->palette[batch->vertices[i].paletteIndex] == expected[i]));
  }
}

TEST_CASE("indices_are_rebased_per_span") {
  auto face = make_face();
  Compositor compositor;
  compositor.add(Span("a", face));
  compositor.add(Span("b", face));
  auto batch = compositor.compose();
  REQUIRE(batch);
  REQUIRE(batch->indices.size() == 12);
  for (size_t i = 0; i < 6; ++i) {
    CHECK_MESSAGE(batch->indices[i] < 4, "first span range");
  }
  for (size_t i = 6; i < 12; ++i) {
    CHECK_MESSAGE(batch->indices[i] >= 4, "second span range");
  }
  CHECK_MESSAGE(indices_in_range(*batch), "indices in range");
}

TEST_CASE("shared_glyphs_are_meshed_once") {
  auto face = make_face();
  Compositor compositor;
  compositor.add(Span("abab", face));
  compositor.add(Span("ba", face));
  REQUIRE(compositor.compose());
  CHECK_MESSAGE(face->outlineCalls() == 2, "one outline fetch per distinct glyph");
  REQUIRE(compositor.compose());
  CHECK_MESSAGE(face->outlineCalls() == 2, "cache survives across compositions");
}

TEST_CASE("shaping_failure_aborts_composition") {
  auto good = make_face();
  auto bad = make_face();
  bad->setShapingFails(true);
  Compositor compositor;
  compositor.add(Span("ab", good));
  compositor.add(Span("ab", bad));
  Diagnostics diagnostics;
  CHECK_MESSAGE(!compositor.compose(&diagnostics), "no batch");
  CHECK_MESSAGE(diagnostics.count(ErrorKind::ShapingFailure) == 1, "failure reported");
}

TEST_CASE("vertex_overflow_aborts_composition") {
  auto face = make_face();
  std::string text(9000, 'a');
  Compositor compositor;
  compositor.add(Span(text, face));
  compositor.add(Span(text, face));
  Diagnostics diagnostics;
  CHECK_MESSAGE(!compositor.compose(&diagnostics), "no batch");
  CHECK_MESSAGE(diagnostics.count(ErrorKind::IndexOverflow) == 1, "overflow reported");
}

TEST_CASE("empty_compositor_gives_empty_batch") {
  Compositor compositor;
  auto batch = compositor.compose();
  REQUIRE(batch);
  CHECK(batch->vertices.empty());
  CHECK(batch->indices.empty());
  CHECK(batch->palette.empty());
}

TEST_CASE("render_issues_one_draw_with_three_instances") {
  auto face = make_face();
  Compositor compositor(RenderSize{320, 240});
  compositor.add(Span("ab", face).withColor(Red));
  compositor.add(Span("cd", face).withColor(Blue));
  RecordingBackend backend;
  Color clear{0.5f, 0.5f, 0.5f, 1.0f};
  auto image = compositor.render(backend, nullptr, clear);
  REQUIRE(image);
  CHECK_MESSAGE(backend.calls == 1, "single draw");
  CHECK_MESSAGE(backend.instanceCount == 3, "three instances");
  REQUIRE(backend.offsets.size() == 3);
  CHECK(backend.offsets[0] == doctest::Approx(-1.0f / 3.0f));
  CHECK(backend.offsets[1] == doctest::Approx(1.0f / 3.0f));
  CHECK(backend.offsets[2] == 0.0f);
  REQUIRE(backend.palette.size() == 2);
  CHECK((backend.palette[0] == Red));
  CHECK((backend.palette[1] == Blue));
  CHECK_MESSAGE(backend.vertexCount == 16, "all vertices submitted");
  CHECK_MESSAGE(backend.indexCount == 24, "all indices submitted");
  CHECK_MESSAGE(backend.renderSize.width == 320, "target width");
  CHECK_MESSAGE(backend.renderSize.height == 240, "target height");
  CHECK_MESSAGE((backend.clearColor == clear), "clear color forwarded");
  CHECK_MESSAGE(image->width == 320, "backend image returned");
}

TEST_CASE("render_skips_backend_when_composition_fails") {
  auto face = make_face();
  face->setShapingFails(true);
  Compositor compositor;
  compositor.add(Span("ab", face));
  RecordingBackend backend;
  CHECK(!compositor.render(backend));
  CHECK(backend.calls == 0);
}

TEST_CASE("clear_drops_spans") {
  Compositor compositor;
  compositor.add(Span("ab", make_face()));
  REQUIRE(compositor.spans().size() == 1);
  compositor.clear();
  CHECK(compositor.spans().empty());
}

TEST_SUITE_END();
