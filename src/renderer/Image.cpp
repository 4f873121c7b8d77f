#include "VectorText/renderer/Image.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <fstream>

namespace VectorText {

namespace {

auto to_channel(float v) -> uint8_t {
  float clamped = std::clamp(v, 0.0f, 1.0f);
  return static_cast<uint8_t>(std::lround(clamped * 255.0f));
}

} // namespace

auto ToRgba8(Color color) -> Rgba8 {
  return Rgba8{to_channel(color.r), to_channel(color.g), to_channel(color.b), to_channel(color.a)};
}

auto MakeImage(uint32_t width, uint32_t height, Rgba8 fill) -> Image {
  Image image;
  image.width = width;
  image.height = height;
  image.strideBytes = width * 4u;
  image.pixels.resize(static_cast<size_t>(image.strideBytes) * height);
  for (size_t i = 0; i < image.pixels.size(); i += 4) {
    image.pixels[i + 0] = fill.r;
    image.pixels[i + 1] = fill.g;
    image.pixels[i + 2] = fill.b;
    image.pixels[i + 3] = fill.a;
  }
  return image;
}

auto WritePpm(Image const& image, std::string const& path) -> bool {
  std::ofstream output(path, std::ios::binary);
  if (!output.is_open()) {
    spdlog::error("cannot open {} for writing", path);
    return false;
  }
  output << "P6\n" << image.width << " " << image.height << "\n255\n";
  std::vector<uint8_t> row(static_cast<size_t>(image.width) * 3);
  for (uint32_t y = 0; y < image.height; ++y) {
    uint8_t const* src = image.pixels.data() + static_cast<size_t>(y) * image.strideBytes;
    for (uint32_t x = 0; x < image.width; ++x) {
      row[x * 3 + 0] = src[x * 4 + 0];
      row[x * 3 + 1] = src[x * 4 + 1];
      row[x * 3 + 2] = src[x * 4 + 2];
    }
    output.write(reinterpret_cast<const char*>(row.data()), static_cast<std::streamsize>(row.size()));
  }
  return static_cast<bool>(output);
}

} // namespace VectorText
