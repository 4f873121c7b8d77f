#include "VectorText/text/FontFace.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstddef>
#include <fstream>
#include <utility>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H
#include FT_TRUETYPE_TABLES_H
#include FT_TRUETYPE_TAGS_H
#include <hb.h>
#include <hb-ft.h>

namespace VectorText {

namespace {

std::atomic<uint32_t> nextFaceId{1};

using LibraryHandle = std::shared_ptr<FT_LibraryRec_>;

void select_unicode_charmap(FT_Face face) {
  if (!face) return;
  if (FT_Select_Charmap(face, FT_ENCODING_UNICODE) == 0) return;
  for (int i = 0; i < face->num_charmaps; ++i) {
    if (face->charmaps[i] && face->charmaps[i]->encoding == FT_ENCODING_UNICODE) {
      FT_Set_Charmap(face, face->charmaps[i]);
      return;
    }
  }
}

auto has_glyf_table(FT_Face face) -> bool {
  FT_ULong length = 0;
  return FT_Load_Sfnt_Table(face, TTAG_glyf, 0, nullptr, &length) == 0 && length > 0;
}

struct DecomposeState {
  std::vector<OutlineEvent>* events = nullptr;
  bool open = false;
};

auto to_float(FT_Pos v) -> float {
  return static_cast<float>(v);
}

int decompose_move_to(FT_Vector const* to, void* user) {
  auto* state = static_cast<DecomposeState*>(user);
  if (state->open) state->events->push_back(OutlineEvent::close());
  state->events->push_back(OutlineEvent::moveTo(to_float(to->x), to_float(to->y)));
  state->open = true;
  return 0;
}

int decompose_line_to(FT_Vector const* to, void* user) {
  auto* state = static_cast<DecomposeState*>(user);
  state->events->push_back(OutlineEvent::lineTo(to_float(to->x), to_float(to->y)));
  return 0;
}

int decompose_conic_to(FT_Vector const* control, FT_Vector const* to, void* user) {
  auto* state = static_cast<DecomposeState*>(user);
  state->events->push_back(OutlineEvent::quadTo(to_float(control->x), to_float(control->y),
                                                to_float(to->x), to_float(to->y)));
  return 0;
}

int decompose_cubic_to(FT_Vector const* c1, FT_Vector const* c2, FT_Vector const* to, void* user) {
  auto* state = static_cast<DecomposeState*>(user);
  state->events->push_back(OutlineEvent::cubicTo(to_float(c1->x), to_float(c1->y),
                                                 to_float(c2->x), to_float(c2->y),
                                                 to_float(to->x), to_float(to->y)));
  return 0;
}

} // namespace

struct FontFace::Impl {
  LibraryHandle library;
  std::vector<uint8_t> bytes;
  FT_Face face = nullptr;
  hb_font_t* hbFont = nullptr;
  uint32_t id = 0;
  std::string family;
  bool nativeContours = false;

  ~Impl() {
    if (hbFont) hb_font_destroy(hbFont);
    if (face) FT_Done_Face(face);
  }
};

FontFace::FontFace(std::unique_ptr<Impl> impl)
    : impl(std::move(impl)) {}

FontFace::~FontFace() = default;

auto FontFace::id() const -> uint32_t {
  return impl->id;
}

auto FontFace::unitsPerEm() const -> uint16_t {
  return static_cast<uint16_t>(impl->face->units_per_EM);
}

bool FontFace::hasNativeContours() const {
  return impl->nativeContours;
}

auto FontFace::familyName() const -> std::string const& {
  return impl->family;
}

auto FontFace::glyphCount() const -> uint32_t {
  return static_cast<uint32_t>(impl->face->num_glyphs);
}

auto FontFace::glyphIndex(uint32_t codepoint) const -> uint32_t {
  return FT_Get_Char_Index(impl->face, codepoint);
}

auto FontFace::outline(uint32_t glyphId) const -> std::optional<GlyphOutline> {
  FT_Int32 loadFlags = FT_LOAD_NO_SCALE | FT_LOAD_NO_HINTING | FT_LOAD_NO_BITMAP;
  if (FT_Load_Glyph(impl->face, glyphId, loadFlags) != 0) return std::nullopt;
  FT_GlyphSlot slot = impl->face->glyph;
  if (slot->format != FT_GLYPH_FORMAT_OUTLINE || slot->outline.n_contours <= 0) return std::nullopt;

  GlyphOutline out;
  DecomposeState state{&out.events, false};
  FT_Outline_Funcs funcs{};
  funcs.move_to = decompose_move_to;
  funcs.line_to = decompose_line_to;
  funcs.conic_to = decompose_conic_to;
  funcs.cubic_to = decompose_cubic_to;
  funcs.shift = 0;
  funcs.delta = 0;
  if (FT_Outline_Decompose(&slot->outline, &funcs, &state) != 0) {
    spdlog::warn("glyph {}: outline decomposition failed", glyphId);
    return std::nullopt;
  }
  if (state.open) out.events.push_back(OutlineEvent::close());

  FT_BBox box{};
  FT_Outline_Get_CBox(&slot->outline, &box);
  out.bounds = Rect{to_float(box.xMin), to_float(box.yMin), to_float(box.xMax), to_float(box.yMax)};
  return out;
}

auto FontFace::shape(std::string_view text,
                     Diagnostics* diagnostics) const -> std::optional<std::vector<GlyphAdvance>> {
  std::vector<GlyphAdvance> glyphs;
  if (text.empty()) return glyphs;

  hb_buffer_t* buffer = hb_buffer_create();
  hb_buffer_add_utf8(buffer,
                     text.data(),
                     static_cast<int>(text.size()),
                     0,
                     static_cast<int>(text.size()));
  hb_buffer_guess_segment_properties(buffer);
  hb_shape(impl->hbFont, buffer, nullptr, 0);
  if (!hb_buffer_allocation_successful(buffer)) {
    hb_buffer_destroy(buffer);
    spdlog::error("shaping failed for face {}", impl->id);
    Report(diagnostics, ErrorKind::ShapingFailure, 0, "harfbuzz buffer allocation failed");
    return std::nullopt;
  }

  unsigned int glyphCount = 0;
  hb_glyph_info_t* infos = hb_buffer_get_glyph_infos(buffer, &glyphCount);
  hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(buffer, &glyphCount);
  glyphs.reserve(glyphCount);
  for (unsigned int i = 0; i < glyphCount; ++i) {
    GlyphAdvance advance;
    advance.glyphId = infos[i].codepoint;
    advance.xAdvance = positions[i].x_advance;
    advance.yAdvance = positions[i].y_advance;
    advance.xOffset = positions[i].x_offset;
    advance.yOffset = positions[i].y_offset;
    glyphs.push_back(advance);
  }
  hb_buffer_destroy(buffer);
  return glyphs;
}

struct FontLoader::Impl {
  LibraryHandle library;

  Impl() {
    FT_Library raw = nullptr;
    if (FT_Init_FreeType(&raw) == 0 && raw) {
      library = LibraryHandle(raw, [](FT_Library lib) { FT_Done_FreeType(lib); });
    } else {
      spdlog::error("FreeType initialization failed");
    }
  }
};

FontLoader::FontLoader()
    : impl(std::make_unique<Impl>()) {}

FontLoader::~FontLoader() = default;

auto FontLoader::loadMemory(std::vector<uint8_t> bytes,
                            Diagnostics* diagnostics,
                            uint32_t faceIndex) -> std::shared_ptr<FontFace> {
  if (!impl->library) {
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "font library unavailable");
    return nullptr;
  }
  if (bytes.empty()) {
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "empty font data");
    return nullptr;
  }

  auto faceImpl = std::make_unique<FontFace::Impl>();
  faceImpl->library = impl->library;
  faceImpl->bytes = std::move(bytes);
  FT_Face face = nullptr;
  if (FT_New_Memory_Face(impl->library.get(),
                         reinterpret_cast<const FT_Byte*>(faceImpl->bytes.data()),
                         static_cast<FT_Long>(faceImpl->bytes.size()),
                         static_cast<FT_Long>(faceIndex),
                         &face) != 0 || !face) {
    spdlog::error("font data could not be parsed");
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "font data could not be parsed");
    return nullptr;
  }
  faceImpl->face = face;
  if (!FT_IS_SCALABLE(face) || face->units_per_EM == 0) {
    spdlog::error("font face has no scalable outlines");
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "font face has no scalable outlines");
    return nullptr;
  }

  select_unicode_charmap(face);
  hb_face_t* hbFace = hb_ft_face_create_referenced(face);
  // A plain hb_font keeps the face's upem as scale, so shaping yields font units.
  faceImpl->hbFont = hb_font_create(hbFace);
  hb_face_destroy(hbFace);
  faceImpl->id = nextFaceId++;
  faceImpl->family = face->family_name ? face->family_name : "";
  faceImpl->nativeContours = has_glyf_table(face);

  spdlog::debug("loaded face {} '{}' upem {} glyf {}",
                faceImpl->id,
                faceImpl->family,
                face->units_per_EM,
                faceImpl->nativeContours);
  return std::shared_ptr<FontFace>(new FontFace(std::move(faceImpl)));
}

auto FontLoader::loadFile(std::string const& path,
                          Diagnostics* diagnostics,
                          uint32_t faceIndex) -> std::shared_ptr<FontFace> {
  std::ifstream input(path, std::ios::binary);
  if (!input.is_open()) {
    spdlog::error("cannot open font file {}", path);
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "cannot open font file " + path);
    return nullptr;
  }
  input.seekg(0, std::ios::end);
  auto size = input.tellg();
  if (size <= 0) {
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "font file is empty: " + path);
    return nullptr;
  }
  input.seekg(0, std::ios::beg);
  std::vector<uint8_t> bytes(static_cast<size_t>(size));
  input.read(reinterpret_cast<char*>(bytes.data()), size);
  if (!input) {
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "cannot read font file " + path);
    return nullptr;
  }
  return loadMemory(std::move(bytes), diagnostics, faceIndex);
}

} // namespace VectorText
