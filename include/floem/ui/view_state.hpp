#pragma once

#include <floem/reactive/scope.hpp>
#include <floem/reactive/signal.hpp>
#include <floem/ui/recalc.hpp>
#include <floem/ui/style.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace floem::ui {

using ViewId = std::uint64_t;

namespace detail {
inline std::atomic<ViewId> next_view_id{1};
} // namespace detail

class UnknownView : public std::logic_error {
public:
  explicit UnknownView(ViewId id)
      : std::logic_error{"unknown view " + std::to_string(id)}, id_{id} {}

  ViewId id() const noexcept { return id_; }

private:
  ViewId id_;
};

class ViewBorrowError : public std::logic_error {
public:
  explicit ViewBorrowError(ViewId id)
      : std::logic_error{"view " + std::to_string(id) +
                         " already mutably borrowed"} {}
};

enum class ChangeFlags : std::uint8_t {
  None = 0,
  Style = 1u << 0,
  ViewStyle = 1u << 1,
  Layout = 1u << 2,
  Paint = 1u << 3,
};

constexpr ChangeFlags operator|(ChangeFlags a, ChangeFlags b) noexcept {
  return static_cast<ChangeFlags>(static_cast<std::uint8_t>(a) |
                                  static_cast<std::uint8_t>(b));
}

constexpr ChangeFlags operator&(ChangeFlags a, ChangeFlags b) noexcept {
  return static_cast<ChangeFlags>(static_cast<std::uint8_t>(a) &
                                  static_cast<std::uint8_t>(b));
}

constexpr ChangeFlags operator~(ChangeFlags a) noexcept {
  return static_cast<ChangeFlags>(~static_cast<std::uint8_t>(a));
}

constexpr ChangeFlags &operator|=(ChangeFlags &a, ChangeFlags b) noexcept {
  return a = a | b;
}

constexpr ChangeFlags &operator&=(ChangeFlags &a, ChangeFlags b) noexcept {
  return a = a & b;
}

constexpr bool has_flag(ChangeFlags set, ChangeFlags bit) noexcept {
  return (set & bit) != ChangeFlags::None;
}

// Ordered style layers of one view. Offsets handed out by push() stay valid
// for the life of the stack; slot 0 is the view's own base style.
class StyleStack {
public:
  StyleStack() { slots_.emplace_back(); }

  std::size_t push(Style s) {
    slots_.push_back(std::move(s));
    return slots_.size() - 1;
  }

  void set(std::size_t offset, Style s) {
    if (offset >= slots_.size()) {
      throw std::out_of_range{"style slot " + std::to_string(offset) +
                              " out of range"};
    }
    slots_[offset] = std::move(s);
  }

  const Style *get(std::size_t offset) const {
    return offset < slots_.size() ? &slots_[offset] : nullptr;
  }

  std::size_t size() const noexcept { return slots_.size(); }

  Style combined() const {
    Style out;
    for (const auto &s : slots_) {
      out.apply(s);
    }
    return out;
  }

private:
  std::vector<Style> slots_;
};

// Per-view style state. Owned by ViewTree; mutate through ViewTree::borrow_mut.
struct ViewState {
  explicit ViewState(ViewId view_id, reactive::Scope view_scope)
      : id{view_id}, scope{view_scope},
        layout_requested{scope.create_rw_signal(false)} {}

  ViewId id;
  reactive::Scope scope;
  std::optional<ViewId> parent{};
  std::vector<ViewId> children{};

  StyleStack style{};
  Style animated{};
  std::vector<std::string> classes{};

  // Stack, animation and matched classes flattened against the interaction
  // state of the last full resolution.
  Style combined{};
  // combined over the inherited properties of the parent.
  Style computed{};
  StyleSelectors has_style_selectors{};

  ChangeFlags requested_changes{ChangeFlags::None};
  bool request_style_recursive{false};
  bool classes_changed{false};

  bool disabled{false};
  bool selected{false};
  bool hidden{false};
  bool hidden_changed{false};
  bool effective_disabled{false};
  bool effective_selected{false};

  bool resolved{false};
  bool layout_stale{true};
  double font_px{16.0};
  std::unordered_map<std::string, double> layout_px{};
  reactive::RwSignal<bool> layout_requested;

  std::uint64_t full_resolutions{0};
  std::uint64_t inherited_fast_paths{0};
  std::uint64_t style_skips{0};

private:
  friend class ViewStateRef;
  bool borrowed_{false};
};

// Exclusive access to one ViewState. A second live borrow of the same view
// throws ViewBorrowError.
class ViewStateRef {
public:
  explicit ViewStateRef(ViewState &state) : state_{&state} {
    if (state.borrowed_) {
      throw ViewBorrowError{state.id};
    }
    state.borrowed_ = true;
  }

  ViewStateRef(const ViewStateRef &) = delete;
  ViewStateRef &operator=(const ViewStateRef &) = delete;

  ViewStateRef(ViewStateRef &&other) noexcept
      : state_{std::exchange(other.state_, nullptr)} {}

  ViewStateRef &operator=(ViewStateRef &&) = delete;

  ~ViewStateRef() {
    if (state_) {
      state_->borrowed_ = false;
    }
  }

  ViewState *operator->() const noexcept { return state_; }
  ViewState &operator*() const noexcept { return *state_; }

private:
  ViewState *state_;
};

} // namespace floem::ui
