#pragma once

#include <floem/ui/base_style.hpp>
#include <floem/ui/selectors.hpp>

#include <algorithm>
#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace floem::ui {

// Interaction and window state a style is resolved against.
struct InteractionState {
  bool hovered{false};
  bool focused{false};
  bool focus_visible{false};
  bool active{false};
  bool dragging{false};
  bool disabled{false};
  bool selected{false};
  bool dark_mode{false};
  ScreenSizeBp screen_size_bp{ScreenSizeBp::Xs};

  bool matches(StyleSelector s) const noexcept {
    switch (s) {
    case StyleSelector::Hover:
      return hovered;
    case StyleSelector::Focus:
      return focused;
    case StyleSelector::FocusVisible:
      return focus_visible;
    case StyleSelector::Disabled:
      return disabled;
    case StyleSelector::DarkMode:
      return dark_mode;
    case StyleSelector::Active:
      return active;
    case StyleSelector::Dragging:
      return dragging;
    case StyleSelector::Selected:
      return selected;
    }
    return false;
  }
};

// Property map plus sub-maps that only apply under a selector, a responsive
// breakpoint, or (for class definitions) to descendants carrying the class.
class Style {
public:
  Style() = default;

  Style &set(std::string key, PropValue value) {
    props_.insert_or_assign(std::move(key), std::move(value));
    return *this;
  }

  Style &set(std::string key, const char *value) {
    return set(std::move(key), PropValue{std::string{value}});
  }

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool> &&
                !std::is_same_v<std::remove_reference_t<Int>, std::int64_t>>>
  Style &set(std::string key, Int value) {
    return set(std::move(key), PropValue{static_cast<std::int64_t>(value)});
  }

  Style &remove(const std::string &key) {
    props_.erase(key);
    return *this;
  }

  Style &font_size(double v) { return set("font_size", v); }
  Style &font_family(std::string v) { return set("font_family", std::move(v)); }
  Style &color(ColorU8 c) { return set("color", c); }
  Style &background(ColorU8 c) { return set("background", c); }
  Style &width(Length l) { return set("width", l); }
  Style &height(Length l) { return set("height", l); }
  Style &padding(Length l) { return set("padding", l); }

  Style &selector(StyleSelector s, const Style &sub) {
    sub_style(selectors_, s).apply(sub);
    return *this;
  }

  Style &hover(const Style &sub) { return selector(StyleSelector::Hover, sub); }
  Style &focus(const Style &sub) { return selector(StyleSelector::Focus, sub); }
  Style &focus_visible(const Style &sub) {
    return selector(StyleSelector::FocusVisible, sub);
  }
  Style &active(const Style &sub) {
    return selector(StyleSelector::Active, sub);
  }
  Style &disabled(const Style &sub) {
    return selector(StyleSelector::Disabled, sub);
  }
  Style &selected(const Style &sub) {
    return selector(StyleSelector::Selected, sub);
  }
  Style &dragging(const Style &sub) {
    return selector(StyleSelector::Dragging, sub);
  }
  Style &dark_mode(const Style &sub) {
    return selector(StyleSelector::DarkMode, sub);
  }

  Style &responsive(ScreenSizeBp bp, const Style &sub) {
    sub_style(responsive_, bp).apply(sub);
    return *this;
  }

  // Defines the style applied to descendants that carry `name`.
  Style &class_def(std::string name, const Style &sub) {
    sub_style(classes_, std::move(name)).apply(sub);
    return *this;
  }

  const Props &props() const noexcept { return props_; }

  const PropValue *get(const std::string &key) const {
    return find_prop(props_, key);
  }

  const Style *selector_style(StyleSelector s) const {
    return find_sub(selectors_, s);
  }

  const Style *responsive_style(ScreenSizeBp bp) const {
    return find_sub(responsive_, bp);
  }

  const Style *class_style(const std::string &name) const {
    return find_sub(classes_, name);
  }

  const std::vector<std::pair<StyleSelector, Style>> &
  selector_styles() const noexcept {
    return selectors_;
  }

  const std::vector<std::pair<ScreenSizeBp, Style>> &
  responsive_styles() const noexcept {
    return responsive_;
  }

  const std::vector<std::pair<std::string, Style>> &class_defs() const noexcept {
    return classes_;
  }

  bool empty() const noexcept {
    return props_.empty() && selectors_.empty() && responsive_.empty() &&
           classes_.empty();
  }

  bool has_class_defs() const noexcept { return !classes_.empty(); }

  // Later values win; sub-maps merge recursively.
  void apply(const Style &other) {
    for (const auto &kv : other.props_) {
      props_.insert_or_assign(kv.first, kv.second);
    }
    for (const auto &kv : other.selectors_) {
      sub_style(selectors_, kv.first).apply(kv.second);
    }
    for (const auto &kv : other.responsive_) {
      sub_style(responsive_, kv.first).apply(kv.second);
    }
    for (const auto &kv : other.classes_) {
      sub_style(classes_, kv.first).apply(kv.second);
    }
  }

  Style applied(const Style &other) const {
    Style out = *this;
    out.apply(other);
    return out;
  }

  void apply_only_inherited(const Style &other) {
    for (const auto &kv : other.props_) {
      if (is_inherited(kv.first)) {
        props_.insert_or_assign(kv.first, kv.second);
      }
    }
  }

  void apply_class_defs(const Style &other) {
    for (const auto &kv : other.classes_) {
      sub_style(classes_, kv.first).apply(kv.second);
    }
  }

  // Every selector reachable from this style, nested ones included. Class
  // definitions are excluded; they style other nodes.
  StyleSelectors selectors() const {
    StyleSelectors out;
    for (const auto &kv : selectors_) {
      out = out.set(kv.first).union_with(kv.second.selectors());
    }
    for (const auto &kv : responsive_) {
      out.responsive = true;
      out = out.union_with(kv.second.selectors());
    }
    return out;
  }

  // Flattens the sub-maps that match `state` into plain props. Class
  // definitions are carried over untouched.
  Style resolve(const InteractionState &state) const {
    Style out;
    out.props_ = props_;
    out.classes_ = classes_;
    for (const auto s : all_selectors) {
      if (!state.matches(s)) {
        continue;
      }
      if (const auto *sub = selector_style(s)) {
        out.apply(sub->resolve(state));
      }
    }
    if (const auto *sub = responsive_style(state.screen_size_bp)) {
      out.apply(sub->resolve(state));
    }
    return out;
  }

  friend bool operator==(const Style &a, const Style &b) {
    return a.props_ == b.props_ && a.selectors_ == b.selectors_ &&
           a.responsive_ == b.responsive_ && a.classes_ == b.classes_;
  }

private:
  template <typename K>
  static Style &sub_style(std::vector<std::pair<K, Style>> &subs, K key) {
    for (auto &kv : subs) {
      if (kv.first == key) {
        return kv.second;
      }
    }
    subs.emplace_back(std::move(key), Style{});
    return subs.back().second;
  }

  template <typename K>
  static const Style *find_sub(const std::vector<std::pair<K, Style>> &subs,
                               const K &key) {
    for (const auto &kv : subs) {
      if (kv.first == key) {
        return &kv.second;
      }
    }
    return nullptr;
  }

  Props props_{};
  std::vector<std::pair<StyleSelector, Style>> selectors_{};
  std::vector<std::pair<ScreenSizeBp, Style>> responsive_{};
  std::vector<std::pair<std::string, Style>> classes_{};
};

inline void dump_style(std::ostream &os, const Style &style, int indent = 0) {
  const auto pad = [&](int n) {
    for (int i = 0; i < n; ++i) {
      os << ' ';
    }
  };

  std::vector<std::string> keys;
  keys.reserve(style.props().size());
  for (const auto &kv : style.props()) {
    keys.push_back(kv.first);
  }
  std::sort(keys.begin(), keys.end());
  for (const auto &k : keys) {
    pad(indent);
    os << k << " = ";
    dump_prop_value(os, style.props().at(k));
    os << "\n";
  }
  for (const auto &kv : style.selector_styles()) {
    pad(indent);
    os << "[" << selector_name(kv.first) << "]\n";
    dump_style(os, kv.second, indent + 2);
  }
  for (const auto &kv : style.responsive_styles()) {
    pad(indent);
    os << "[responsive " << breakpoint_name(kv.first) << "]\n";
    dump_style(os, kv.second, indent + 2);
  }
  for (const auto &kv : style.class_defs()) {
    pad(indent);
    os << "[class " << kv.first << "]\n";
    dump_style(os, kv.second, indent + 2);
  }
}

} // namespace floem::ui
