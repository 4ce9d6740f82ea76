#pragma once

#include <floem/ui/units.hpp>

#include <memory>
#include <string>
#include <vector>

namespace floem::ui {

struct FontLoadResult {
  bool ok{false};
  std::string error;
};

// Font metrics read from a font file through FreeType. Measurements are cached
// per integer pixel size.
class FreeTypeFontMetrics final : public FontMetrics {
public:
  FreeTypeFontMetrics();
  ~FreeTypeFontMetrics() override;

  FreeTypeFontMetrics(const FreeTypeFontMetrics &) = delete;
  FreeTypeFontMetrics &operator=(const FreeTypeFontMetrics &) = delete;

  FontLoadResult load(const std::string &path);

  // Tries the usual system font locations in order.
  FontLoadResult load_default();

  bool loaded() const noexcept;

  const std::string &font_path() const noexcept { return font_path_; }

  double ch_advance(double font_size_px) const override;

  double x_height(double font_size_px) const override;

  static std::vector<std::string> default_font_candidates();

private:
  struct Impl;

  std::unique_ptr<Impl> impl_;
  std::string font_path_{};
};

} // namespace floem::ui
