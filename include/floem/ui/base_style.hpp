#pragma once

#include <floem/ui/recalc.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace floem::ui {

struct ColorU8 {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};

  friend bool operator==(const ColorU8 &, const ColorU8 &) = default;
};

using Color = ColorU8;

enum class Unit : std::uint8_t { Px, Pct, Em, Rem, Ch, Ex, Auto };

struct Length {
  double value{};
  Unit unit{Unit::Px};

  friend bool operator==(const Length &, const Length &) = default;
};

inline Length px(double v) { return Length{v, Unit::Px}; }
inline Length pct(double v) { return Length{v, Unit::Pct}; }
inline Length em(double v) { return Length{v, Unit::Em}; }
inline Length rem(double v) { return Length{v, Unit::Rem}; }
inline Length ch(double v) { return Length{v, Unit::Ch}; }
inline Length ex(double v) { return Length{v, Unit::Ex}; }
inline Length auto_length() { return Length{0.0, Unit::Auto}; }

inline bool is_font_relative(Unit u) noexcept {
  return u == Unit::Em || u == Unit::Rem || u == Unit::Ch || u == Unit::Ex;
}

inline const char *unit_suffix(Unit u) {
  switch (u) {
  case Unit::Px:
    return "px";
  case Unit::Pct:
    return "%";
  case Unit::Em:
    return "em";
  case Unit::Rem:
    return "rem";
  case Unit::Ch:
    return "ch";
  case Unit::Ex:
    return "ex";
  case Unit::Auto:
    return "auto";
  }
  return "";
}

using PropValue =
    std::variant<std::string, std::int64_t, double, bool, Length, ColorU8>;

using Props = std::unordered_map<std::string, PropValue>;

inline ColorU8 color_from_u32(std::uint32_t rgba) {
  ColorU8 c;
  c.r = static_cast<std::uint8_t>((rgba >> 24) & 0xFFu);
  c.g = static_cast<std::uint8_t>((rgba >> 16) & 0xFFu);
  c.b = static_cast<std::uint8_t>((rgba >> 8) & 0xFFu);
  c.a = static_cast<std::uint8_t>(rgba & 0xFFu);
  return c;
}

inline int hex_nibble(char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return 10 + (ch - 'a');
  }
  if (ch >= 'A' && ch <= 'F') {
    return 10 + (ch - 'A');
  }
  return -1;
}

inline bool parse_hex_byte(std::string_view s, std::size_t i,
                           std::uint8_t &out) {
  if (i + 1 >= s.size()) {
    return false;
  }
  const int hi = hex_nibble(s[i]);
  const int lo = hex_nibble(s[i + 1]);
  if (hi < 0 || lo < 0) {
    return false;
  }
  out = static_cast<std::uint8_t>((hi << 4) | lo);
  return true;
}

// "#rrggbb" or "#rrggbbaa".
inline std::optional<ColorU8> parse_color(std::string_view s) {
  if (s.size() == 7 && s[0] == '#') {
    std::uint8_t r{}, g{}, b{};
    if (!parse_hex_byte(s, 1, r) || !parse_hex_byte(s, 3, g) ||
        !parse_hex_byte(s, 5, b)) {
      return std::nullopt;
    }
    return ColorU8{r, g, b, 255};
  }
  if (s.size() == 9 && s[0] == '#') {
    std::uint8_t r{}, g{}, b{}, a{};
    if (!parse_hex_byte(s, 1, r) || !parse_hex_byte(s, 3, g) ||
        !parse_hex_byte(s, 5, b) || !parse_hex_byte(s, 7, a)) {
      return std::nullopt;
    }
    return ColorU8{r, g, b, a};
  }
  return std::nullopt;
}

// "12px", "50%", "1.5em", "2rem", "3ch", "2ex", "auto" or a bare number (px).
// Non-finite numbers are rejected.
inline std::optional<Length> parse_length(std::string_view s) {
  if (s == "auto") {
    return auto_length();
  }
  double v{};
  const auto *first = s.data();
  const auto *last = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (ec != std::errc{} || ptr == first || !std::isfinite(v)) {
    return std::nullopt;
  }
  const std::string_view suffix{ptr, static_cast<std::size_t>(last - ptr)};
  if (suffix.empty() || suffix == "px") {
    return px(v);
  }
  if (suffix == "%") {
    return pct(v);
  }
  if (suffix == "em") {
    return em(v);
  }
  if (suffix == "rem") {
    return rem(v);
  }
  if (suffix == "ch") {
    return ch(v);
  }
  if (suffix == "ex") {
    return ex(v);
  }
  return std::nullopt;
}

inline const PropValue *find_prop(const Props &props, const std::string &key) {
  const auto it = props.find(key);
  if (it == props.end()) {
    return nullptr;
  }
  return &it->second;
}

inline double prop_as_double(const Props &props, const std::string &key,
                             double fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *d = std::get_if<double>(pv)) {
    return *d;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return static_cast<double>(*i);
  }
  if (const auto *l = std::get_if<Length>(pv)) {
    if (l->unit == Unit::Px) {
      return l->value;
    }
  }
  if (const auto *b = std::get_if<bool>(pv)) {
    return *b ? 1.0 : 0.0;
  }
  return fallback;
}

inline float prop_as_float(const Props &props, const std::string &key,
                           float fallback) {
  return static_cast<float>(
      prop_as_double(props, key, static_cast<double>(fallback)));
}

inline std::string prop_as_string(const Props &props, const std::string &key,
                                  std::string fallback = {}) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    return *s;
  }
  return fallback;
}

inline bool prop_as_bool(const Props &props, const std::string &key,
                         bool fallback) {
  const auto it = props.find(key);
  if (it == props.end()) {
    return fallback;
  }
  if (const auto *b = std::get_if<bool>(&it->second)) {
    return *b;
  }
  if (const auto *i = std::get_if<std::int64_t>(&it->second)) {
    return *i != 0;
  }
  if (const auto *d = std::get_if<double>(&it->second)) {
    return *d != 0.0;
  }
  return fallback;
}

inline std::optional<Length> prop_as_length(const Props &props,
                                            const std::string &key) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return std::nullopt;
  }
  if (const auto *l = std::get_if<Length>(pv)) {
    return *l;
  }
  if (const auto *d = std::get_if<double>(pv)) {
    return px(*d);
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return px(static_cast<double>(*i));
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    return parse_length(*s);
  }
  return std::nullopt;
}

inline ColorU8 prop_as_color(const Props &props, const std::string &key,
                             ColorU8 fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *c = std::get_if<ColorU8>(pv)) {
    return *c;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    const auto u = static_cast<std::uint32_t>(
        static_cast<std::uint64_t>(*i) & 0xFFFFFFFFull);
    if (u <= 0xFFFFFFu) {
      return ColorU8{static_cast<std::uint8_t>((u >> 16) & 0xFFu),
                     static_cast<std::uint8_t>((u >> 8) & 0xFFu),
                     static_cast<std::uint8_t>(u & 0xFFu), 255};
    }
    return color_from_u32(u);
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    if (const auto c = parse_color(*s)) {
      return *c;
    }
  }
  return fallback;
}

inline void dump_prop_value(std::ostream &os, const PropValue &v) {
  std::visit(
      [&](const auto &x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::string>) {
          os << '"' << x << '"';
        } else if constexpr (std::is_same_v<T, bool>) {
          os << (x ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Length>) {
          if (x.unit == Unit::Auto) {
            os << "auto";
          } else {
            os << x.value << unit_suffix(x.unit);
          }
        } else if constexpr (std::is_same_v<T, ColorU8>) {
          static constexpr char hex[] = "0123456789abcdef";
          os << '#';
          for (const auto byte : {x.r, x.g, x.b, x.a}) {
            os << hex[byte >> 4] << hex[byte & 0xF];
          }
        } else {
          os << x;
        }
      },
      v);
}

enum class Interpolation : std::uint8_t { None, Number, Length, Color };

enum class PropAffects : std::uint8_t {
  None = 0,
  Layout = 1u << 0,
  Paint = 1u << 1,
  Font = 1u << 2,
};

constexpr PropAffects operator|(PropAffects a, PropAffects b) noexcept {
  return static_cast<PropAffects>(static_cast<std::uint8_t>(a) |
                                  static_cast<std::uint8_t>(b));
}

constexpr bool affects(PropAffects set, PropAffects bit) noexcept {
  return (static_cast<std::uint8_t>(set) & static_cast<std::uint8_t>(bit)) != 0;
}

struct PropInfo {
  std::string name;
  bool inherited{false};
  Interpolation interpolation{Interpolation::None};
  PropAffects affects{PropAffects::Paint};
  InheritedGroups group{InheritedGroups::NONE};
};

namespace detail {

inline std::unordered_map<std::string, PropInfo> builtin_props() {
  using A = PropAffects;
  using I = Interpolation;
  std::unordered_map<std::string, PropInfo> out;
  const auto add = [&](std::string name, bool inherited, I interp, A aff,
                       InheritedGroups group = InheritedGroups::NONE) {
    auto key = name;
    out.insert_or_assign(std::move(key),
                         PropInfo{std::move(name), inherited, interp, aff, group});
  };

  add("font_size", true, I::Length, A::Layout | A::Paint | A::Font,
      InheritedGroups::FONT);
  add("font_family", true, I::None, A::Layout | A::Paint | A::Font,
      InheritedGroups::FONT);
  add("font_weight", true, I::Number, A::Layout | A::Paint | A::Font,
      InheritedGroups::FONT);
  add("line_height", true, I::Number, A::Layout | A::Paint,
      InheritedGroups::FONT);
  add("color", true, I::Color, A::Paint, InheritedGroups::TEXT);
  add("cursor", true, I::None, A::None, InheritedGroups::OTHER);

  for (const char *name : {"width", "height", "min_width", "min_height",
                           "max_width", "max_height", "padding", "margin",
                           "gap", "flex_basis", "border_width"}) {
    add(name, false, I::Length, A::Layout);
  }
  add("flex_grow", false, I::Number, A::Layout);
  add("flex_shrink", false, I::Number, A::Layout);
  add("display", false, I::None, A::Layout | A::Paint);
  add("grid_row", false, I::None, A::Layout);
  add("grid_column", false, I::None, A::Layout);

  add("background", false, I::Color, A::Paint);
  add("border_color", false, I::Color, A::Paint);
  add("border_radius", false, I::Length, A::Paint);
  add("outline", false, I::Length, A::Paint);
  add("box_shadow", false, I::None, A::Paint);
  add("opacity", false, I::Number, A::Paint);
  add("transform", false, I::None, A::Paint);
  add("z_index", false, I::None, A::Paint);
  add("focusable", false, I::None, A::None);
  return out;
}

} // namespace detail

inline std::unordered_map<std::string, PropInfo> &prop_registry() {
  static std::unordered_map<std::string, PropInfo> registry =
      detail::builtin_props();
  return registry;
}

// Adds or replaces the metadata for a property name.
inline void register_prop(PropInfo info) {
  auto key = info.name;
  prop_registry().insert_or_assign(std::move(key), std::move(info));
}

inline const PropInfo *prop_info(const std::string &name) {
  const auto &reg = prop_registry();
  const auto it = reg.find(name);
  if (it == reg.end()) {
    return nullptr;
  }
  return &it->second;
}

inline bool is_inherited(const std::string &name) {
  const auto *info = prop_info(name);
  return info && info->inherited;
}

// Unregistered properties are treated as non-inherited paint properties.
inline PropAffects prop_affects(const std::string &name) {
  const auto *info = prop_info(name);
  return info ? info->affects : PropAffects::Paint;
}

inline InheritedGroups prop_group(const std::string &name) {
  const auto *info = prop_info(name);
  if (!info || !info->inherited) {
    return InheritedGroups::NONE;
  }
  return info->group == InheritedGroups::NONE ? InheritedGroups::OTHER
                                              : info->group;
}

namespace detail {

inline double lerp(double a, double b, double t) { return a + (b - a) * t; }

inline std::uint8_t lerp_u8(std::uint8_t a, std::uint8_t b, double t) {
  const double v = lerp(static_cast<double>(a), static_cast<double>(b), t);
  return static_cast<std::uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

inline std::optional<double> as_number(const PropValue &v) {
  if (const auto *d = std::get_if<double>(&v)) {
    return *d;
  }
  if (const auto *i = std::get_if<std::int64_t>(&v)) {
    return static_cast<double>(*i);
  }
  return std::nullopt;
}

} // namespace detail

// Value at progress t in [0, 1] of a transition from `from` to `to`. Values
// that cannot blend switch over at the halfway point.
inline PropValue interpolate(const PropInfo &info, const PropValue &from,
                             const PropValue &to, double t) {
  t = std::clamp(t, 0.0, 1.0);
  switch (info.interpolation) {
  case Interpolation::Number: {
    const auto a = detail::as_number(from);
    const auto b = detail::as_number(to);
    if (a && b) {
      return detail::lerp(*a, *b, t);
    }
    break;
  }
  case Interpolation::Length: {
    const auto *a = std::get_if<Length>(&from);
    const auto *b = std::get_if<Length>(&to);
    if (a && b && a->unit == b->unit && a->unit != Unit::Auto) {
      return Length{detail::lerp(a->value, b->value, t), a->unit};
    }
    const auto na = detail::as_number(from);
    const auto nb = detail::as_number(to);
    if (na && nb) {
      return detail::lerp(*na, *nb, t);
    }
    break;
  }
  case Interpolation::Color: {
    const auto *a = std::get_if<ColorU8>(&from);
    const auto *b = std::get_if<ColorU8>(&to);
    if (a && b) {
      return ColorU8{detail::lerp_u8(a->r, b->r, t),
                     detail::lerp_u8(a->g, b->g, t),
                     detail::lerp_u8(a->b, b->b, t),
                     detail::lerp_u8(a->a, b->a, t)};
    }
    break;
  }
  case Interpolation::None:
    break;
  }
  return t >= 0.5 ? to : from;
}

} // namespace floem::ui
