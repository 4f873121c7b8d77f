#pragma once

#include "VectorText/mesh/Geometry.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace VectorText {

struct Rgba8 {
  uint8_t r{};
  uint8_t g{};
  uint8_t b{};
  uint8_t a{};

  bool operator==(Rgba8 const& other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
};

constexpr auto PackRGBA8(Rgba8 c) -> uint32_t {
  return static_cast<uint32_t>(c.r) |
         (static_cast<uint32_t>(c.g) << 8) |
         (static_cast<uint32_t>(c.b) << 16) |
         (static_cast<uint32_t>(c.a) << 24);
}

constexpr auto UnpackRGBA8(uint32_t rgba) -> Rgba8 {
  return Rgba8{
      static_cast<uint8_t>(rgba & 0xFFu),
      static_cast<uint8_t>((rgba >> 8) & 0xFFu),
      static_cast<uint8_t>((rgba >> 16) & 0xFFu),
      static_cast<uint8_t>((rgba >> 24) & 0xFFu),
  };
}

auto ToRgba8(Color color) -> Rgba8;

// Row-major RGBA8 pixels, first row at the top.
struct Image {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t strideBytes = 0;
  std::vector<uint8_t> pixels;

  auto pixel(uint32_t x, uint32_t y) const -> Rgba8 {
    size_t idx = static_cast<size_t>(y) * strideBytes + static_cast<size_t>(x) * 4;
    return Rgba8{pixels[idx + 0], pixels[idx + 1], pixels[idx + 2], pixels[idx + 3]};
  }
};

auto MakeImage(uint32_t width, uint32_t height, Rgba8 fill) -> Image;

// Binary PPM (P6). Alpha is dropped.
auto WritePpm(Image const& image, std::string const& path) -> bool;

} // namespace VectorText
