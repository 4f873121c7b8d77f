#pragma once

#include "VectorText/text/Typeface.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace VectorText {

// A FreeType face with its HarfBuzz font. Outlines are read unscaled and
// unhinted, so every coordinate is in font design units.
class FontFace final : public Typeface {
public:
  ~FontFace() override;

  FontFace(FontFace const&) = delete;
  FontFace& operator=(FontFace const&) = delete;

  auto id() const -> uint32_t override;
  auto unitsPerEm() const -> uint16_t override;
  bool hasNativeContours() const override;
  auto outline(uint32_t glyphId) const -> std::optional<GlyphOutline> override;
  auto shape(std::string_view text,
             Diagnostics* diagnostics) const -> std::optional<std::vector<GlyphAdvance>> override;

  auto familyName() const -> std::string const&;
  auto glyphCount() const -> uint32_t;
  // Glyph id of a Unicode codepoint, 0 when unmapped.
  auto glyphIndex(uint32_t codepoint) const -> uint32_t;

private:
  friend class FontLoader;
  struct Impl;
  explicit FontFace(std::unique_ptr<Impl> impl);
  std::unique_ptr<Impl> impl;
};

// Owns the FreeType library handle shared by every face it loads. Faces keep
// the library alive, so the loader may be destroyed before them.
class FontLoader {
public:
  FontLoader();
  ~FontLoader();

  FontLoader(FontLoader const&) = delete;
  FontLoader& operator=(FontLoader const&) = delete;

  // nullptr plus an InvalidFontData issue when the bytes are not a font.
  auto loadMemory(std::vector<uint8_t> bytes,
                  Diagnostics* diagnostics = nullptr,
                  uint32_t faceIndex = 0) -> std::shared_ptr<FontFace>;
  auto loadFile(std::string const& path,
                Diagnostics* diagnostics = nullptr,
                uint32_t faceIndex = 0) -> std::shared_ptr<FontFace>;

private:
  struct Impl;
  std::unique_ptr<Impl> impl;
};

} // namespace VectorText
