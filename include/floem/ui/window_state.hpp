#pragma once

#include <floem/ui/recalc.hpp>
#include <floem/ui/selectors.hpp>
#include <floem/ui/style.hpp>
#include <floem/ui/style_cache.hpp>
#include <floem/ui/view_state.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace floem::ui {

struct RequestStyle {
  ViewId id{};
};

struct RequestStyleRecursive {
  ViewId id{};
};

// Replaces one slot of the view's style stack.
struct RequestViewStyle {
  ViewId id{};
  std::size_t slot{};
  Style style;
};

struct ClassChanged {
  ViewId id{};
  std::string name;
  bool added{true};
};

struct DisabledChanged {
  ViewId id{};
  bool disabled{};
};

struct SelectedChanged {
  ViewId id{};
  bool selected{};
};

struct HiddenChanged {
  ViewId id{};
  bool hidden{};
};

struct AnimatedPropChanged {
  ViewId id{};
  std::string key;
  std::optional<PropValue> value;
};

using UpdateMessage =
    std::variant<RequestStyle, RequestStyleRecursive, RequestViewStyle,
                 ClassChanged, DisabledChanged, SelectedChanged, HiddenChanged,
                 AnimatedPropChanged>;

inline ViewId message_target(const UpdateMessage &m) {
  return std::visit([](const auto &v) { return v.id; }, m);
}

// Window-wide inputs to style resolution plus the deferred work queued for
// the next style pass.
struct WindowState {
  std::unordered_set<ViewId> hovered{};
  std::optional<ViewId> focus{};
  bool keyboard_navigation{false};
  std::optional<ViewId> active{};
  std::optional<ViewId> dragging{};

  bool dark_mode{false};
  double window_width{0.0};
  ScreenSizeBp screen_size_bp{ScreenSizeBp::Xs};
  GridBreakpoints grid_breakpoints{};
  double root_font_size{16.0};
  double default_font_size{16.0};

  StyleCache style_cache{};

  StyleRecalcChange pending_global_recalc{};
  std::unordered_set<ViewId> style_dirty{};
  std::vector<UpdateMessage> messages{};

  bool request_layout{false};
  bool request_paint{false};

  void post(UpdateMessage m) { messages.push_back(std::move(m)); }

  void mark_dark_mode_changed() {
    pending_global_recalc = pending_global_recalc.combine(StyleRecalcChange{
        Propagate::RecalcDescendants, RecalcFlags::DARK_MODE_CHANGED});
  }

  void mark_responsive_changed() {
    pending_global_recalc = pending_global_recalc.combine(StyleRecalcChange{
        Propagate::RecalcDescendants, RecalcFlags::RESPONSIVE_CHANGED});
  }

  // Percent lengths at the root depend on the window width.
  void mark_window_resized() {
    pending_global_recalc =
        pending_global_recalc.ensure_at_least(Propagate::InheritedOnly);
  }

  void mark_font_units_changed() {
    pending_global_recalc = pending_global_recalc.combine(StyleRecalcChange{
        Propagate::RecalcDescendants, RecalcFlags::FONT_UNITS_CHANGED});
  }

  void mark_classes_changed() {
    pending_global_recalc = pending_global_recalc.combine(StyleRecalcChange{
        Propagate::RecalcDescendants, RecalcFlags::CLASS_CHANGED});
  }

  StyleRecalcChange take_global_recalc() {
    return std::exchange(pending_global_recalc, StyleRecalcChange::NONE);
  }

  bool is_hovered(ViewId id) const { return hovered.contains(id); }
  bool is_focused(ViewId id) const { return focus == id; }
  bool is_active(ViewId id) const { return active == id; }
  bool is_dragging(ViewId id) const { return dragging == id; }

  // Drops every reference to a removed view.
  void forget(ViewId id) {
    hovered.erase(id);
    style_dirty.erase(id);
    if (focus == id) {
      focus.reset();
    }
    if (active == id) {
      active.reset();
    }
    if (dragging == id) {
      dragging.reset();
    }
  }
};

} // namespace floem::ui
