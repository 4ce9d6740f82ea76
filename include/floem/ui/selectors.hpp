#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace floem::ui {

enum class StyleSelector : std::uint8_t {
  Hover = 1u << 0,
  Focus = 1u << 1,
  FocusVisible = 1u << 2,
  Disabled = 1u << 3,
  DarkMode = 1u << 4,
  Active = 1u << 5,
  Dragging = 1u << 6,
  Selected = 1u << 7,
};

inline constexpr std::array<StyleSelector, 8> all_selectors{
    StyleSelector::Hover,    StyleSelector::Focus,
    StyleSelector::FocusVisible, StyleSelector::Disabled,
    StyleSelector::Active,   StyleSelector::Dragging,
    StyleSelector::Selected, StyleSelector::DarkMode,
};

inline const char *selector_name(StyleSelector s) {
  switch (s) {
  case StyleSelector::Hover:
    return "Hover";
  case StyleSelector::Focus:
    return "Focus";
  case StyleSelector::FocusVisible:
    return "FocusVisible";
  case StyleSelector::Disabled:
    return "Disabled";
  case StyleSelector::DarkMode:
    return "DarkMode";
  case StyleSelector::Active:
    return "Active";
  case StyleSelector::Dragging:
    return "Dragging";
  case StyleSelector::Selected:
    return "Selected";
  }
  return "?";
}

// Accepts "hover", "focus_visible", "dark_mode" style keys as well as the
// display names.
inline std::optional<StyleSelector> parse_selector(std::string_view s) {
  if (s == "hover" || s == "Hover") {
    return StyleSelector::Hover;
  }
  if (s == "focus" || s == "Focus") {
    return StyleSelector::Focus;
  }
  if (s == "focus_visible" || s == "FocusVisible") {
    return StyleSelector::FocusVisible;
  }
  if (s == "disabled" || s == "Disabled") {
    return StyleSelector::Disabled;
  }
  if (s == "dark_mode" || s == "dark" || s == "DarkMode") {
    return StyleSelector::DarkMode;
  }
  if (s == "active" || s == "pressed" || s == "Active") {
    return StyleSelector::Active;
  }
  if (s == "dragging" || s == "Dragging") {
    return StyleSelector::Dragging;
  }
  if (s == "selected" || s == "Selected") {
    return StyleSelector::Selected;
  }
  return std::nullopt;
}

struct StyleSelectors {
  std::uint8_t bits{0};
  bool responsive{false};

  StyleSelectors set(StyleSelector s, bool value = true) const {
    StyleSelectors out = *this;
    const auto v = static_cast<std::uint8_t>(s);
    if (value) {
      out.bits = static_cast<std::uint8_t>(out.bits | v);
    } else {
      out.bits = static_cast<std::uint8_t>(out.bits & ~v);
    }
    return out;
  }

  bool has(StyleSelector s) const noexcept {
    const auto v = static_cast<std::uint8_t>(s);
    return (bits & v) == v;
  }

  bool has_responsive() const noexcept { return responsive; }

  bool empty() const noexcept { return bits == 0 && !responsive; }

  StyleSelectors union_with(StyleSelectors other) const {
    return StyleSelectors{static_cast<std::uint8_t>(bits | other.bits),
                          responsive || other.responsive};
  }

  std::string debug_string() const {
    std::string out;
    for (const auto s : all_selectors) {
      if (!has(s)) {
        continue;
      }
      if (!out.empty()) {
        out += " + ";
      }
      out += selector_name(s);
    }
    if (out.empty()) {
      return responsive ? "Responsive" : "None";
    }
    if (responsive) {
      out += " (Responsive)";
    }
    return out;
  }

  friend bool operator==(const StyleSelectors &,
                         const StyleSelectors &) = default;
};

enum class ScreenSizeBp : std::uint8_t { Xs, Sm, Md, Lg, Xl, Xxl };

inline const char *breakpoint_name(ScreenSizeBp bp) {
  switch (bp) {
  case ScreenSizeBp::Xs:
    return "xs";
  case ScreenSizeBp::Sm:
    return "sm";
  case ScreenSizeBp::Md:
    return "md";
  case ScreenSizeBp::Lg:
    return "lg";
  case ScreenSizeBp::Xl:
    return "xl";
  case ScreenSizeBp::Xxl:
    return "xxl";
  }
  return "?";
}

inline std::optional<ScreenSizeBp> parse_breakpoint(std::string_view s) {
  if (s == "xs") {
    return ScreenSizeBp::Xs;
  }
  if (s == "sm") {
    return ScreenSizeBp::Sm;
  }
  if (s == "md") {
    return ScreenSizeBp::Md;
  }
  if (s == "lg") {
    return ScreenSizeBp::Lg;
  }
  if (s == "xl") {
    return ScreenSizeBp::Xl;
  }
  if (s == "xxl") {
    return ScreenSizeBp::Xxl;
  }
  return std::nullopt;
}

// Lower bounds in px of each breakpoint above Xs.
struct GridBreakpoints {
  double sm{576.0};
  double md{768.0};
  double lg{992.0};
  double xl{1200.0};
  double xxl{1400.0};

  ScreenSizeBp get_width_bp(double width) const {
    if (width < sm) {
      return ScreenSizeBp::Xs;
    }
    if (width < md) {
      return ScreenSizeBp::Sm;
    }
    if (width < lg) {
      return ScreenSizeBp::Md;
    }
    if (width < xl) {
      return ScreenSizeBp::Lg;
    }
    if (width < xxl) {
      return ScreenSizeBp::Xl;
    }
    return ScreenSizeBp::Xxl;
  }
};

} // namespace floem::ui
