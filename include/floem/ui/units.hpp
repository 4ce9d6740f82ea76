#pragma once

#include <floem/ui/base_style.hpp>

#include <optional>

namespace floem::ui {

// Font measurements needed to resolve ch and ex style units.
class FontMetrics {
public:
  virtual ~FontMetrics() = default;

  virtual double ch_advance(double font_size_px) const = 0;

  virtual double x_height(double font_size_px) const = 0;
};

// Half an em for both metrics.
class ApproxFontMetrics final : public FontMetrics {
public:
  double ch_advance(double font_size_px) const override {
    return font_size_px * 0.5;
  }

  double x_height(double font_size_px) const override {
    return font_size_px * 0.5;
  }
};

struct UnitContext {
  double font_size{16.0};
  double root_font_size{16.0};
  std::optional<double> parent_extent{};
  const FontMetrics *metrics{};
};

// Returns nullopt for auto and for percentages without a parent extent.
inline std::optional<double> resolve_length(const Length &l,
                                            const UnitContext &cx) {
  switch (l.unit) {
  case Unit::Px:
    return l.value;
  case Unit::Pct:
    if (!cx.parent_extent) {
      return std::nullopt;
    }
    return *cx.parent_extent * l.value / 100.0;
  case Unit::Em:
    return l.value * cx.font_size;
  case Unit::Rem:
    return l.value * cx.root_font_size;
  case Unit::Ch:
  case Unit::Ex: {
    const ApproxFontMetrics fallback;
    const FontMetrics &m = cx.metrics ? *cx.metrics : fallback;
    return l.value * (l.unit == Unit::Ch ? m.ch_advance(cx.font_size)
                                         : m.x_height(cx.font_size));
  }
  case Unit::Auto:
    return std::nullopt;
  }
  return std::nullopt;
}

} // namespace floem::ui
