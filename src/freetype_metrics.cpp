#include <floem/ui/freetype_metrics.hpp>

#include <floem/log.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>
#include <utility>

namespace floem::ui {

struct FreeTypeFontMetrics::Impl {
  struct Measure {
    double ch{};
    double x_height{};
  };

  ~Impl() {
    if (face) {
      FT_Done_Face(face);
    }
    if (ft) {
      FT_Done_FreeType(ft);
    }
  }

  Measure measure(int px) {
    if (const auto it = cache.find(px); it != cache.end()) {
      return it->second;
    }

    Measure m{px * 0.5, px * 0.5};
    if (face && FT_Set_Pixel_Sizes(face, 0, static_cast<FT_UInt>(px)) == 0) {
      if (FT_Load_Char(face, '0', FT_LOAD_DEFAULT) == 0) {
        m.ch = static_cast<double>(face->glyph->advance.x) / 64.0;
      }
      if (FT_Load_Char(face, 'x', FT_LOAD_DEFAULT) == 0) {
        m.x_height = static_cast<double>(face->glyph->metrics.height) / 64.0;
      }
    }
    cache.emplace(px, m);
    return m;
  }

  FT_Library ft{};
  FT_Face face{};
  std::unordered_map<int, Measure> cache;
};

FreeTypeFontMetrics::FreeTypeFontMetrics() : impl_{std::make_unique<Impl>()} {}

FreeTypeFontMetrics::~FreeTypeFontMetrics() = default;

FontLoadResult FreeTypeFontMetrics::load(const std::string &path) {
  if (!impl_->ft) {
    if (FT_Init_FreeType(&impl_->ft) != 0) {
      impl_->ft = nullptr;
      return FontLoadResult{false, "FT_Init_FreeType failed"};
    }
  }

  FT_Face face{};
  if (FT_New_Face(impl_->ft, path.c_str(), 0, &face) != 0) {
    return FontLoadResult{false, "cannot open font face: " + path};
  }
  if (impl_->face) {
    FT_Done_Face(impl_->face);
  }
  impl_->face = face;
  impl_->cache.clear();
  font_path_ = path;
  floem_log("loaded font " + path, "Text");
  return FontLoadResult{true, {}};
}

FontLoadResult FreeTypeFontMetrics::load_default() {
  for (const auto &p : default_font_candidates()) {
    FILE *f = std::fopen(p.c_str(), "rb");
    if (!f) {
      continue;
    }
    std::fclose(f);
    auto r = load(p);
    if (r.ok) {
      return r;
    }
  }
  return FontLoadResult{false, "no readable system font found"};
}

bool FreeTypeFontMetrics::loaded() const noexcept {
  return impl_->face != nullptr;
}

namespace {

// Glyphs are measured at a whole pixel size in [1, 4096]; NaN measures at 1.
int measure_size(double font_size_px) {
  if (!(font_size_px >= 1.0)) {
    return 1;
  }
  return static_cast<int>(std::lround(std::min(font_size_px, 4096.0)));
}

} // namespace

double FreeTypeFontMetrics::ch_advance(double font_size_px) const {
  const int px = measure_size(font_size_px);
  return impl_->measure(px).ch * (font_size_px / px);
}

double FreeTypeFontMetrics::x_height(double font_size_px) const {
  const int px = measure_size(font_size_px);
  return impl_->measure(px).x_height * (font_size_px / px);
}

std::vector<std::string> FreeTypeFontMetrics::default_font_candidates() {
  return {
#if defined(__APPLE__)
      "/System/Library/Fonts/Supplemental/Arial.ttf",
      "/System/Library/Fonts/SFNS.ttf",
#else
      "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
      "/usr/share/fonts/truetype/freefont/FreeSans.ttf",
      "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
      "/usr/share/fonts/TTF/DejaVuSans.ttf",
#endif
  };
}

} // namespace floem::ui
