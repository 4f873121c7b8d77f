#include "VectorText/renderer/Compositor.hpp"
#include "VectorText/renderer/SoftwareRasterizer.hpp"
#include "VectorText/text/FontFace.hpp"
#include "VectorText/text/Span.hpp"
#include "VectorText/util/Logging.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace VectorTextDemo {

using namespace VectorText;

auto default_font_dirs() -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> dirs;
  dirs.emplace_back("/usr/share/fonts");
  dirs.emplace_back("/usr/local/share/fonts");
  if (auto* home = std::getenv("HOME")) {
    dirs.emplace_back(std::filesystem::path(home) / ".local/share/fonts");
    dirs.emplace_back(std::filesystem::path(home) / ".fonts");
  }
  return dirs;
}

auto find_font_file() -> std::optional<std::filesystem::path> {
  for (auto const& dir : default_font_dirs()) {
    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) continue;
    for (auto const& entry : std::filesystem::recursive_directory_iterator(dir, ec)) {
      if (ec) break;
      if (!entry.is_regular_file()) continue;
      auto ext = entry.path().extension().string();
      if (ext == ".ttf" || ext == ".otf") {
        return entry.path();
      }
    }
  }
  return std::nullopt;
}

void print_issues(Diagnostics const& diagnostics) {
  for (auto const& issue : diagnostics.issues) {
    std::cerr << errorKindName(issue.kind) << " glyph " << issue.glyphId << ": " << issue.detail << "\n";
  }
}

} // namespace VectorTextDemo

int main(int argc, char** argv) {
  using namespace VectorText;
  using namespace VectorTextDemo;

  InitLogging();

  std::string outPath = "text_render_demo.ppm";
  std::string fontPath;
  std::string text = "Hello, World!";
  uint32_t width = 960;
  uint32_t height = 600;
  float size = 48.0f;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--font" && i + 1 < argc) {
      fontPath = argv[++i];
    } else if (arg == "--out" && i + 1 < argc) {
      outPath = argv[++i];
    } else if (arg == "--width" && i + 1 < argc) {
      width = static_cast<uint32_t>(std::max(1, std::atoi(argv[++i])));
    } else if (arg == "--height" && i + 1 < argc) {
      height = static_cast<uint32_t>(std::max(1, std::atoi(argv[++i])));
    } else if (arg == "--text" && i + 1 < argc) {
      text = argv[++i];
    } else if (arg == "--size" && i + 1 < argc) {
      size = std::max(1.0f, static_cast<float>(std::atof(argv[++i])));
    }
  }

  if (fontPath.empty()) {
    if (auto found = find_font_file()) {
      fontPath = found->string();
    } else {
      std::cerr << "no font found. Pass --font <file.ttf>.\n";
      return 1;
    }
  }

  Diagnostics diagnostics;
  FontLoader loader;
  std::shared_ptr<FontFace> face = loader.loadFile(fontPath, &diagnostics);
  if (!face) {
    print_issues(diagnostics);
    return 1;
  }
  spdlog::info("using font {} ({})", fontPath, face->familyName());

  float w = static_cast<float>(width);
  float h = static_cast<float>(height);
  Span base = Span(text, face).withFontSize(size);

  Compositor compositor(RenderSize{width, height});
  compositor.add(base.withBox(BoxSize{w, h})
                     .withAlign(Align::Middle, Align::Middle)
                     .withColor(Color{0.07f, 0.09f, 0.12f, 1.0f}));
  compositor.add(base.withText("top left")
                     .withFontSize(size * 0.5f)
                     .withPosition(Point2D{24.0f, 0.0f})
                     .withBox(BoxSize{w, h - 24.0f})
                     .withVerticalAlign(Align::End)
                     .withColor(Color{0.85f, 0.25f, 0.2f, 1.0f}));
  compositor.add(base.withText("bottom right")
                     .withFontSizePoints(12.0f)
                     .withBox(BoxSize{w - 24.0f, 24.0f})
                     .withHorizontalAlign(Align::End)
                     .withColor(Color{0.2f, 0.45f, 0.85f, 1.0f}));
  compositor.add(base.withText("translucent")
                     .withFontSize(size * 0.75f)
                     .withPosition(Point2D{24.0f, h * 0.25f})
                     .withColor(Color{0.2f, 0.6f, 0.3f, 0.5f}));

  SoftwareRasterizer rasterizer;
  auto image = compositor.render(rasterizer, &diagnostics);
  print_issues(diagnostics);
  if (!image) {
    std::cerr << "rendering failed\n";
    return 1;
  }

  if (!WritePpm(*image, outPath)) {
    std::cerr << "failed to write output: " << outPath << "\n";
    return 1;
  }

  std::cout << "wrote " << outPath << "\n";
  return 0;
}
