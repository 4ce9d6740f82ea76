#pragma once

#include <floem/log.hpp>
#include <floem/reactive/scope.hpp>
#include <floem/ui/recalc.hpp>
#include <floem/ui/style.hpp>
#include <floem/ui/style_cache.hpp>
#include <floem/ui/units.hpp>
#include <floem/ui/view_state.hpp>
#include <floem/ui/window_state.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace floem::ui {

struct StylePassStats {
  std::size_t visited{0};
  std::size_t full_resolutions{0};
  std::size_t fast_paths{0};
  std::size_t skipped{0};
  std::size_t cache_hits{0};

  std::size_t recalculated() const noexcept {
    return full_resolutions + fast_paths;
  }
};

// Geometry handed to the layout collaborator.
struct ViewLayout {
  std::unordered_map<std::string, double> props;
  bool stale{false};
};

// Thrown when the tree is restyled or restructured while a style pass is
// walking it.
class StylePassReentry : public std::logic_error {
public:
  explicit StylePassReentry(const std::string &what)
      : std::logic_error{what + " called during a style pass"} {}
};

namespace detail {

class StylePassGuard {
public:
  explicit StylePassGuard(bool &flag) : flag_{flag} {
    if (flag_) {
      throw StylePassReentry{"style_pass"};
    }
    flag_ = true;
  }

  StylePassGuard(const StylePassGuard &) = delete;
  StylePassGuard &operator=(const StylePassGuard &) = delete;

  ~StylePassGuard() { flag_ = false; }

private:
  bool &flag_;
};

// What a node hands down to its children during a style pass.
struct InheritedContext {
  Style inherited;
  Style class_defs;
  bool disabled{false};
  bool selected{false};
  double font_px{16.0};
  std::optional<double> parent_width{};
};

struct PropsDiff {
  bool any{false};
  bool layout{false};
  bool paint{false};
  InheritedChanges inherited{};
};

inline void note_prop_change(PropsDiff &d, const std::string &key) {
  d.any = true;
  const auto a = prop_affects(key);
  d.layout = d.layout || affects(a, PropAffects::Layout);
  d.paint = d.paint || affects(a, PropAffects::Paint);
  if (is_inherited(key)) {
    d.inherited =
        d.inherited.combine(InheritedChanges::with_groups(prop_group(key)));
  }
}

inline PropsDiff diff_props(const Props &before, const Props &after) {
  PropsDiff d;
  for (const auto &kv : after) {
    const auto *old = find_prop(before, kv.first);
    if (!old || !(*old == kv.second)) {
      note_prop_change(d, kv.first);
    }
  }
  for (const auto &kv : before) {
    if (!after.contains(kv.first)) {
      note_prop_change(d, kv.first);
    }
  }
  return d;
}

} // namespace detail

// Owns the view nodes, their parent/child links and the window state, and
// runs the style pass over them. Each node owns a reactive scope that is a
// child of its parent's scope; removing a view disposes that scope.
class ViewTree {
public:
  ViewTree() : root_{create_node(std::nullopt, reactive::Scope{})} {}

  ViewTree(const ViewTree &) = delete;
  ViewTree &operator=(const ViewTree &) = delete;

  ~ViewTree() { node(root_).scope.dispose(); }

  ViewId root() const noexcept { return root_; }

  WindowState &window() noexcept { return window_; }
  const WindowState &window() const noexcept { return window_; }

  std::size_t size() const noexcept { return nodes_.size(); }

  ViewId add_view(ViewId parent) {
    reject_during_style_pass("add_view");
    auto &p = node(parent);
    const ViewId id = create_node(parent, p.scope.create_child());
    p.children.push_back(id);
    return id;
  }

  void remove_view(ViewId id) {
    if (id == root_) {
      throw std::logic_error{"the root view cannot be removed"};
    }
    reject_during_style_pass("remove_view");
    auto &vs = node(id);
    vs.scope.dispose();
    if (vs.parent) {
      auto &siblings = node(*vs.parent).children;
      siblings.erase(std::remove(siblings.begin(), siblings.end(), id),
                     siblings.end());
    }

    std::vector<ViewId> pending{id};
    while (!pending.empty()) {
      const ViewId cur = pending.back();
      pending.pop_back();
      const auto it = nodes_.find(cur);
      if (it == nodes_.end()) {
        continue;
      }
      pending.insert(pending.end(), it->second->children.begin(),
                     it->second->children.end());
      window_.forget(cur);
      nodes_.erase(it);
    }
    floem_log("removed view " + std::to_string(id), "ViewTree");
  }

  const ViewState *find(ViewId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
  }

  const ViewState &state(ViewId id) const {
    const auto *vs = find(id);
    if (!vs) {
      throw UnknownView{id};
    }
    return *vs;
  }

  ViewStateRef borrow_mut(ViewId id) { return ViewStateRef{node(id)}; }

  std::optional<ViewId> parent(ViewId id) const { return state(id).parent; }

  const std::vector<ViewId> &children(ViewId id) const {
    return state(id).children;
  }

  // Setters only queue work; it is applied when the next style pass starts.

  void set_style(ViewId id, Style s) { update_style(id, 0, std::move(s)); }

  std::size_t push_style(ViewId id, Style s) {
    std::size_t slot = 0;
    {
      auto vs = borrow_mut(id);
      slot = vs->style.push(Style{});
    }
    window_.post(RequestViewStyle{id, slot, std::move(s)});
    return slot;
  }

  void update_style(ViewId id, std::size_t slot, Style s) {
    if (slot >= state(id).style.size()) {
      throw std::out_of_range{"style slot " + std::to_string(slot) +
                              " out of range for view " + std::to_string(id)};
    }
    window_.post(RequestViewStyle{id, slot, std::move(s)});
  }

  // Installs a style slot whose content follows `fn`; signals read by `fn`
  // re-queue the slot whenever they change. The effect lives in the view's
  // scope.
  template <typename F> std::size_t style(ViewId id, F fn) {
    const auto scope = state(id).scope;
    std::size_t slot = 0;
    {
      auto vs = borrow_mut(id);
      slot = vs->style.push(Style{});
    }
    Style initial = scope.create_updater(
        std::move(fn), [this, id, slot](Style next) {
          if (find(id)) {
            window_.post(RequestViewStyle{id, slot, std::move(next)});
          }
        });
    window_.post(RequestViewStyle{id, slot, std::move(initial)});
    return slot;
  }

  void add_class(ViewId id, std::string name) {
    state(id);
    window_.post(ClassChanged{id, std::move(name), true});
  }

  void remove_class(ViewId id, std::string name) {
    state(id);
    window_.post(ClassChanged{id, std::move(name), false});
  }

  void set_disabled(ViewId id, bool disabled) {
    state(id);
    window_.post(DisabledChanged{id, disabled});
  }

  void set_selected(ViewId id, bool selected) {
    state(id);
    window_.post(SelectedChanged{id, selected});
  }

  void set_hidden(ViewId id, bool hidden) {
    state(id);
    window_.post(HiddenChanged{id, hidden});
  }

  void set_animated_prop(ViewId id, std::string key, PropValue value) {
    state(id);
    window_.post(AnimatedPropChanged{id, std::move(key), std::move(value)});
  }

  // Value of `key` at progress t of a transition, blended per the property's
  // registered interpolation.
  void set_animated_prop(ViewId id, std::string key, const PropValue &from,
                         const PropValue &to, double t) {
    const auto *info = prop_info(key);
    auto value = interpolate(info ? *info : PropInfo{key}, from, to, t);
    set_animated_prop(id, std::move(key), std::move(value));
  }

  void clear_animated_prop(ViewId id, std::string key) {
    state(id);
    window_.post(AnimatedPropChanged{id, std::move(key), std::nullopt});
  }

  void request_style(ViewId id) {
    state(id);
    window_.post(RequestStyle{id});
  }

  void request_style_recursive(ViewId id) {
    state(id);
    window_.post(RequestStyleRecursive{id});
  }

  // Global style of the window. Class definitions in it are visible to every
  // view; its inherited properties are the root's defaults.
  void apply_theme(Style theme) {
    theme_ = std::move(theme);
    window_.mark_classes_changed();
  }

  const Style &theme() const noexcept { return theme_; }

  const StyleCache &style_cache() const noexcept { return window_.style_cache; }

  void set_font_metrics(const FontMetrics *metrics) {
    metrics_ = metrics;
    window_.mark_font_units_changed();
  }

  // Window events. A view is only restyled when its styles can react to the
  // state that changed.

  void pointer_enter(ViewId id) {
    state(id);
    if (window_.hovered.insert(id).second) {
      request_if_styled(id, {StyleSelector::Hover, StyleSelector::Active});
    }
  }

  void pointer_leave(ViewId id) {
    state(id);
    if (window_.hovered.erase(id) != 0) {
      request_if_styled(id, {StyleSelector::Hover, StyleSelector::Active});
    }
  }

  void focus(ViewId id, bool keyboard = false) {
    state(id);
    const auto prev = window_.focus;
    if (prev == id && window_.keyboard_navigation == keyboard) {
      return;
    }
    window_.focus = id;
    window_.keyboard_navigation = keyboard;
    if (prev && *prev != id && find(*prev)) {
      request_if_styled(*prev,
                        {StyleSelector::Focus, StyleSelector::FocusVisible});
    }
    request_if_styled(id, {StyleSelector::Focus, StyleSelector::FocusVisible});
  }

  void blur() {
    const auto prev = std::exchange(window_.focus, std::nullopt);
    window_.keyboard_navigation = false;
    if (prev && find(*prev)) {
      request_if_styled(*prev,
                        {StyleSelector::Focus, StyleSelector::FocusVisible});
    }
  }

  void pointer_down(ViewId id) {
    state(id);
    const auto prev = std::exchange(window_.active, id);
    if (prev && *prev != id && find(*prev)) {
      request_if_styled(*prev, {StyleSelector::Active});
    }
    request_if_styled(id, {StyleSelector::Active});
  }

  void pointer_up() {
    const auto prev = std::exchange(window_.active, std::nullopt);
    if (prev && find(*prev)) {
      request_if_styled(*prev, {StyleSelector::Active});
    }
  }

  void drag_start(ViewId id) {
    state(id);
    window_.dragging = id;
    request_if_styled(id, {StyleSelector::Dragging});
  }

  void drag_end() {
    const auto prev = std::exchange(window_.dragging, std::nullopt);
    if (prev && find(*prev)) {
      request_if_styled(*prev, {StyleSelector::Dragging});
    }
  }

  void set_dark_mode(bool dark) {
    if (window_.dark_mode == dark) {
      return;
    }
    window_.dark_mode = dark;
    window_.mark_dark_mode_changed();
  }

  void set_window_width(double width) {
    if (window_.window_width == width) {
      return;
    }
    window_.window_width = width;
    window_.mark_window_resized();
    update_breakpoint();
  }

  void set_grid_breakpoints(GridBreakpoints bps) {
    window_.grid_breakpoints = bps;
    update_breakpoint();
  }

  void set_root_font_size(double px) {
    if (window_.root_font_size == px) {
      return;
    }
    window_.root_font_size = px;
    window_.mark_font_units_changed();
  }

  bool has_pending_messages() const noexcept {
    return !window_.messages.empty();
  }

  // Applies queued messages, then walks the tree in pre-order starting from
  // the root with `initial` combined with any pending window-wide change.
  // Layout signals fire once the walk is over; effects they wake may start
  // the next pass. Calling this from inside the walk throws StylePassReentry.
  StylePassStats style_pass(StyleRecalcChange initial = StyleRecalcChange::NONE) {
    StylePassStats stats;
    std::vector<reactive::RwSignal<bool>> layout_signals;
    {
      detail::StylePassGuard guard{in_style_pass_};
      drain_messages();
      const auto change = initial.combine(window_.take_global_recalc());
      style_view(root_, root_context(), change, stats, layout_signals);
      floem_log(std::string{"style pass "} + to_string(change.propagate()) +
                    " visited=" +
                    std::to_string(stats.visited) +
                    " full=" + std::to_string(stats.full_resolutions) +
                    " fast=" + std::to_string(stats.fast_paths) +
                    " skipped=" + std::to_string(stats.skipped) +
                  " cached=" + std::to_string(stats.cache_hits),
                "StylePass");
    }
    for (const auto &signal : layout_signals) {
      signal.set(true);
    }
    return stats;
  }

  bool in_style_pass() const noexcept { return in_style_pass_; }

  // Resolved lengths in px of the layout-affecting properties of `id`.
  const std::unordered_map<std::string, double> &
  resolve_layout_props(ViewId id) const {
    return state(id).layout_px;
  }

  // Hands the pending layout request of `id` to the caller and clears it.
  std::optional<ViewLayout> take_layout_request(ViewId id) {
    auto vs = borrow_mut(id);
    if (!has_flag(vs->requested_changes, ChangeFlags::Layout)) {
      return std::nullopt;
    }
    vs->requested_changes &= ~ChangeFlags::Layout;
    ViewLayout out{vs->layout_px, vs->layout_stale};
    vs->layout_stale = false;
    return out;
  }

  bool take_paint_request(ViewId id) {
    auto vs = borrow_mut(id);
    const bool requested = has_flag(vs->requested_changes, ChangeFlags::Paint);
    vs->requested_changes &= ~ChangeFlags::Paint;
    return requested;
  }

private:
  ViewId create_node(std::optional<ViewId> parent, reactive::Scope scope) {
    const ViewId id = detail::next_view_id.fetch_add(1);
    auto vs = std::make_unique<ViewState>(id, scope);
    vs->parent = parent;
    nodes_.emplace(id, std::move(vs));
    window_.post(RequestStyle{id});
    return id;
  }

  ViewState &node(ViewId id) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) {
      throw UnknownView{id};
    }
    return *it->second;
  }

  ViewState *find_mut(ViewId id) {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
  }

  void reject_during_style_pass(const char *what) const {
    if (in_style_pass_) {
      throw StylePassReentry{what};
    }
  }

  void update_breakpoint() {
    const auto bp = window_.grid_breakpoints.get_width_bp(window_.window_width);
    if (bp != window_.screen_size_bp) {
      window_.screen_size_bp = bp;
      window_.mark_responsive_changed();
    }
  }

  void request_if_styled(ViewId id,
                         std::initializer_list<StyleSelector> selectors) {
    const auto &has = state(id).has_style_selectors;
    for (const auto s : selectors) {
      if (has.has(s)) {
        window_.post(RequestStyle{id});
        return;
      }
    }
  }

  void drain_messages() {
    auto messages = std::exchange(window_.messages, {});
    for (auto &m : messages) {
      const ViewId id = message_target(m);
      auto *raw = find_mut(id);
      if (!raw) {
        floem_log("dropping message for removed view " + std::to_string(id),
                  "StylePass");
        continue;
      }
      ViewStateRef vs{*raw};
      const bool dirty = std::visit(
          [&](auto &msg) -> bool {
            using T = std::decay_t<decltype(msg)>;
            if constexpr (std::is_same_v<T, RequestStyle>) {
              return true;
            } else if constexpr (std::is_same_v<T, RequestStyleRecursive>) {
              vs->request_style_recursive = true;
              return true;
            } else if constexpr (std::is_same_v<T, RequestViewStyle>) {
              vs->style.set(msg.slot, std::move(msg.style));
              vs->requested_changes |= ChangeFlags::ViewStyle;
              return true;
            } else if constexpr (std::is_same_v<T, ClassChanged>) {
              auto &classes = vs->classes;
              const auto it = std::find(classes.begin(), classes.end(), msg.name);
              if (msg.added == (it != classes.end())) {
                return false;
              }
              if (msg.added) {
                classes.push_back(std::move(msg.name));
              } else {
                classes.erase(it);
              }
              vs->classes_changed = true;
              return true;
            } else if constexpr (std::is_same_v<T, DisabledChanged>) {
              return std::exchange(vs->disabled, msg.disabled) != msg.disabled;
            } else if constexpr (std::is_same_v<T, SelectedChanged>) {
              return std::exchange(vs->selected, msg.selected) != msg.selected;
            } else if constexpr (std::is_same_v<T, HiddenChanged>) {
              if (vs->hidden == msg.hidden) {
                return false;
              }
              vs->hidden = msg.hidden;
              vs->hidden_changed = true;
              return true;
            } else {
              if (msg.value) {
                vs->animated.set(msg.key, std::move(*msg.value));
              } else {
                vs->animated.remove(msg.key);
              }
              return true;
            }
          },
          m);
      if (dirty) {
        vs->requested_changes |= ChangeFlags::Style;
        window_.style_dirty.insert(id);
      }
    }
  }

  InteractionState interaction_state(ViewId id, bool disabled,
                                     bool selected) const {
    InteractionState st;
    st.hovered = window_.is_hovered(id);
    st.focused = window_.is_focused(id);
    st.focus_visible = st.focused && window_.keyboard_navigation;
    st.active = window_.is_active(id);
    st.dragging = window_.is_dragging(id);
    st.disabled = disabled;
    st.selected = selected;
    st.dark_mode = window_.dark_mode;
    st.screen_size_bp = window_.screen_size_bp;
    return st;
  }

  // font_size may be relative: em and % to the parent font, rem to the root.
  double resolve_font_px(const Props &props, double parent_px) const {
    const auto l = prop_as_length(props, "font_size");
    if (!l) {
      return parent_px;
    }
    UnitContext cx{parent_px, window_.root_font_size, parent_px, metrics_};
    return resolve_length(*l, cx).value_or(parent_px);
  }

  std::unordered_map<std::string, double>
  resolve_layout(const Props &computed, double font_px,
                 std::optional<double> parent_width) const {
    std::unordered_map<std::string, double> out;
    const UnitContext cx{font_px, window_.root_font_size, parent_width,
                         metrics_};
    for (const auto &kv : computed) {
      if (!affects(prop_affects(kv.first), PropAffects::Layout)) {
        continue;
      }
      if (const auto *l = std::get_if<Length>(&kv.second)) {
        if (const auto v = resolve_length(*l, cx)) {
          out.insert_or_assign(kv.first, *v);
        }
      } else if (const auto *s = std::get_if<std::string>(&kv.second)) {
        if (const auto parsed = parse_length(*s)) {
          if (const auto v = resolve_length(*parsed, cx)) {
            out.insert_or_assign(kv.first, *v);
          }
        }
      } else if (const auto *d = std::get_if<double>(&kv.second)) {
        out.insert_or_assign(kv.first, *d);
      } else if (const auto *i = std::get_if<std::int64_t>(&kv.second)) {
        out.insert_or_assign(kv.first, static_cast<double>(*i));
      }
    }
    return out;
  }

  detail::InheritedContext root_context() const {
    InteractionState st;
    st.dark_mode = window_.dark_mode;
    st.screen_size_bp = window_.screen_size_bp;
    const Style theme = theme_.resolve(st);

    detail::InheritedContext ctx;
    ctx.class_defs.apply_class_defs(theme);
    ctx.inherited.apply_only_inherited(theme);
    ctx.font_px = resolve_font_px(theme.props(), window_.default_font_size);
    ctx.inherited.set("font_size", ctx.font_px);
    if (window_.window_width > 0.0) {
      ctx.parent_width = window_.window_width;
    }
    return ctx;
  }

  detail::InheritedContext
  child_context(const detail::InheritedContext &parent,
                const ViewState &vs) const {
    detail::InheritedContext ctx;
    ctx.inherited.apply_only_inherited(vs.computed);
    ctx.class_defs = parent.class_defs;
    ctx.class_defs.apply_class_defs(vs.combined);
    ctx.disabled = vs.effective_disabled;
    ctx.selected = vs.effective_selected;
    ctx.font_px = vs.font_px;
    const auto it = vs.layout_px.find("width");
    ctx.parent_width =
        it != vs.layout_px.end() ? std::optional<double>{it->second}
                                 : parent.parent_width;
    return ctx;
  }

  // Full resolution: stack, animation, selectors, responsive, then classes.
  // Identical inputs reuse the window's cached result. Returns whether the
  // class definitions this view hands down changed.
  bool resolve_combined(ViewState &vs, const detail::InheritedContext &ctx,
                        const InteractionState &st, StylePassStats &stats) {
    Style stacked = vs.style.combined();
    stacked.apply(vs.animated);
    auto key = make_style_cache_key(std::move(stacked), st, vs.classes,
                                    ctx.class_defs);

    auto resolved = window_.style_cache.get(key);
    if (resolved) {
      ++stats.cache_hits;
    } else {
      ResolvedStyle out{key.stacked.resolve(st), key.stacked.selectors()};
      for (const auto &kv : key.matched.class_defs()) {
        out.combined.apply(kv.second.resolve(st));
        out.selectors = out.selectors.union_with(kv.second.selectors());
      }
      resolved = window_.style_cache.insert(std::move(key), std::move(out));
    }

    const bool class_defs_changed =
        vs.combined.class_defs() != resolved->combined.class_defs();
    vs.combined = resolved->combined;
    vs.has_style_selectors = resolved->selectors;
    return class_defs_changed;
  }

  void style_view(ViewId id, const detail::InheritedContext &parent_ctx,
                  StyleRecalcChange change, StylePassStats &stats,
                  std::vector<reactive::RwSignal<bool>> &layout_signals) {
    ++stats.visited;
    detail::InheritedContext child_ctx;
    StyleRecalcChange child_change = change.for_children();
    std::vector<ViewId> children;
    {
      auto vs = borrow_mut(id);
      const bool dirty = window_.style_dirty.contains(id);

      if (!change.should_recalc(dirty)) {
        ++vs->style_skips;
        ++stats.skipped;
      } else {
        const bool disabled = vs->disabled || parent_ctx.disabled;
        const bool selected = vs->selected || parent_ctx.selected;
        const bool fast =
            !dirty && vs->resolved &&
            change.can_use_inherited_fast_path(!vs->has_style_selectors.empty());

        bool class_defs_changed = false;
        if (fast) {
          ++vs->inherited_fast_paths;
          ++stats.fast_paths;
        } else {
          class_defs_changed =
              resolve_combined(*vs, parent_ctx,
                               interaction_state(id, disabled, selected), stats);
          ++vs->full_resolutions;
          ++stats.full_resolutions;
        }

        Style computed;
        computed.apply_only_inherited(parent_ctx.inherited);
        for (const auto &kv : vs->combined.props()) {
          computed.set(kv.first, kv.second);
        }
        vs->font_px = resolve_font_px(vs->combined.props(), parent_ctx.font_px);
        computed.set("font_size", vs->font_px);

        const auto diff = detail::diff_props(vs->computed.props(), computed.props());
        vs->computed = std::move(computed);
        vs->resolved = true;

        if (vs->classes_changed) {
          child_change = child_change.combine(StyleRecalcChange{
              Propagate::RecalcChildren, RecalcFlags::CLASS_CHANGED});
        }
        if (class_defs_changed) {
          child_change = child_change.combine(StyleRecalcChange{
              Propagate::RecalcDescendants, RecalcFlags::CLASS_CHANGED});
        }
        if (std::exchange(vs->effective_disabled, disabled) != disabled) {
          child_change = child_change.combine(StyleRecalcChange{
              Propagate::RecalcDescendants, RecalcFlags::DISABLED_CHANGED});
        }
        if (std::exchange(vs->effective_selected, selected) != selected) {
          child_change = child_change.combine(StyleRecalcChange{
              Propagate::RecalcDescendants, RecalcFlags::SELECTED_CHANGED});
        }
        if (diff.inherited.has_changes()) {
          child_change = child_change.ensure_at_least(Propagate::InheritedOnly);
          if (diff.inherited.font_changed()) {
            child_change =
                child_change.with_flags(RecalcFlags::FONT_UNITS_CHANGED);
          }
        }
        if (vs->request_style_recursive) {
          child_change = child_change.force_recalc_descendants();
        }
        if (vs->hidden_changed) {
          vs->layout_stale = true;
          child_change = child_change.force_reattach();
        }
        if (change.needs_reattach()) {
          vs->layout_stale = true;
        }

        auto layout = resolve_layout(vs->computed.props(), vs->font_px,
                                     parent_ctx.parent_width);
        bool layout_changed = diff.layout;
        if (layout != vs->layout_px) {
          layout_changed = true;
          const auto old_width = vs->layout_px.find("width");
          const auto new_width = layout.find("width");
          const bool width_changed =
              (old_width == vs->layout_px.end()) != (new_width == layout.end()) ||
              (new_width != layout.end() && old_width->second != new_width->second);
          if (width_changed) {
            child_change = child_change.ensure_at_least(Propagate::InheritedOnly);
          }
          vs->layout_px = std::move(layout);
        }
        if (layout_changed || vs->layout_stale) {
          vs->requested_changes |= ChangeFlags::Layout;
          window_.request_layout = true;
          layout_signals.push_back(vs->layout_requested);
        }
        if (diff.paint) {
          vs->requested_changes |= ChangeFlags::Paint;
          window_.request_paint = true;
        }

        vs->requested_changes &= ~(ChangeFlags::Style | ChangeFlags::ViewStyle);
        vs->request_style_recursive = false;
        vs->classes_changed = false;
        vs->hidden_changed = false;
        window_.style_dirty.erase(id);
      }

      child_ctx = child_context(parent_ctx, *vs);
      children = vs->children;
    }

    for (const auto child : children) {
      if (find(child)) {
        style_view(child, child_ctx, child_change, stats, layout_signals);
      }
    }
  }

  std::unordered_map<ViewId, std::unique_ptr<ViewState>> nodes_;
  WindowState window_;
  Style theme_;
  const FontMetrics *metrics_{nullptr};
  bool in_style_pass_{false};
  ViewId root_;
};

inline void dump_view_tree(std::ostream &os, const ViewTree &tree, ViewId id,
                           int indent = 0) {
  const auto &vs = tree.state(id);
  os << std::string(static_cast<std::size_t>(indent), ' ') << "view " << vs.id;
  if (!vs.classes.empty()) {
    os << " classes=[";
    for (std::size_t i = 0; i < vs.classes.size(); ++i) {
      os << (i ? "," : "") << vs.classes[i];
    }
    os << "]";
  }
  os << " selectors=" << vs.has_style_selectors.debug_string()
     << " full=" << vs.full_resolutions << " fast=" << vs.inherited_fast_paths
     << " skip=" << vs.style_skips << "\n";
  dump_style(os, vs.computed, indent + 4);
  for (const auto child : vs.children) {
    dump_view_tree(os, tree, child, indent + 2);
  }
}

inline void dump_view_tree(std::ostream &os, const ViewTree &tree) {
  dump_view_tree(os, tree, tree.root());
}

} // namespace floem::ui
