#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace floem::ui {

// How far a style change reaches below the node that received it. Ordered by
// the amount of work it demands.
enum class Propagate : std::uint8_t {
  None,
  UpdatePseudoElements,
  InheritedOnly,
  RecalcChildren,
  RecalcDescendants,
};

inline bool requires_child_traversal(Propagate p) noexcept {
  return p != Propagate::None;
}

inline bool requires_full_resolution(Propagate p) noexcept {
  return p == Propagate::RecalcChildren || p == Propagate::RecalcDescendants;
}

inline bool is_recursive(Propagate p) noexcept {
  return p == Propagate::RecalcDescendants;
}

enum class RecalcFlags : std::uint16_t {
  NONE = 0,
  REATTACH = 1u << 0,
  DISABLED_CHANGED = 1u << 1,
  SELECTED_CHANGED = 1u << 2,
  DARK_MODE_CHANGED = 1u << 3,
  RESPONSIVE_CHANGED = 1u << 4,
  CLASS_CHANGED = 1u << 5,
  SUPPRESS_RECALC = 1u << 6,
  FONT_UNITS_CHANGED = 1u << 7,
};

constexpr RecalcFlags operator|(RecalcFlags a, RecalcFlags b) noexcept {
  return static_cast<RecalcFlags>(static_cast<std::uint16_t>(a) |
                                  static_cast<std::uint16_t>(b));
}

constexpr RecalcFlags operator&(RecalcFlags a, RecalcFlags b) noexcept {
  return static_cast<RecalcFlags>(static_cast<std::uint16_t>(a) &
                                  static_cast<std::uint16_t>(b));
}

constexpr RecalcFlags operator~(RecalcFlags a) noexcept {
  return static_cast<RecalcFlags>(~static_cast<std::uint16_t>(a));
}

constexpr RecalcFlags &operator|=(RecalcFlags &a, RecalcFlags b) noexcept {
  return a = a | b;
}

constexpr bool contains(RecalcFlags set, RecalcFlags bits) noexcept {
  return (set & bits) == bits;
}

constexpr bool intersects(RecalcFlags set, RecalcFlags bits) noexcept {
  return (set & bits) != RecalcFlags::NONE;
}

class StyleRecalcChange {
public:
  static const StyleRecalcChange NONE;

  constexpr StyleRecalcChange() = default;

  constexpr explicit StyleRecalcChange(Propagate propagate,
                                       RecalcFlags flags = RecalcFlags::NONE)
      : propagate_{propagate}, flags_{flags} {}

  constexpr Propagate propagate() const noexcept { return propagate_; }

  constexpr RecalcFlags flags() const noexcept { return flags_; }

  constexpr bool is_empty() const noexcept {
    return propagate_ == Propagate::None && flags_ == RecalcFlags::NONE;
  }

  constexpr StyleRecalcChange with_flags(RecalcFlags flags) const noexcept {
    return StyleRecalcChange{propagate_, flags_ | flags};
  }

  // Only RecalcDescendants and InheritedOnly reach grandchildren. The
  // suppression veto belongs to the node that received it.
  constexpr StyleRecalcChange for_children() const noexcept {
    Propagate child = Propagate::None;
    if (propagate_ == Propagate::RecalcDescendants ||
        propagate_ == Propagate::InheritedOnly) {
      child = propagate_;
    }
    return StyleRecalcChange{child, flags_ & ~RecalcFlags::SUPPRESS_RECALC};
  }

  constexpr StyleRecalcChange
  combine(const StyleRecalcChange &other) const noexcept {
    return StyleRecalcChange{
        propagate_ < other.propagate_ ? other.propagate_ : propagate_,
        flags_ | other.flags_};
  }

  constexpr StyleRecalcChange ensure_at_least(Propagate level) const noexcept {
    return StyleRecalcChange{propagate_ < level ? level : propagate_, flags_};
  }

  constexpr StyleRecalcChange force_recalc_descendants() const noexcept {
    return StyleRecalcChange{Propagate::RecalcDescendants, flags_};
  }

  constexpr StyleRecalcChange force_recalc_children() const noexcept {
    return ensure_at_least(Propagate::RecalcChildren);
  }

  constexpr StyleRecalcChange force_reattach() const noexcept {
    return with_flags(RecalcFlags::REATTACH);
  }

  constexpr bool should_recalc(bool view_is_dirty) const noexcept {
    if (contains(flags_, RecalcFlags::SUPPRESS_RECALC)) {
      return false;
    }
    return view_is_dirty || requires_child_traversal(propagate_);
  }

  constexpr bool
  can_use_inherited_fast_path(bool view_has_selectors) const noexcept {
    if (view_has_selectors) {
      return false;
    }
    return propagate_ == Propagate::InheritedOnly &&
           !intersects(flags_, RecalcFlags::DISABLED_CHANGED |
                                   RecalcFlags::SELECTED_CHANGED |
                                   RecalcFlags::DARK_MODE_CHANGED |
                                   RecalcFlags::CLASS_CHANGED);
  }

  constexpr bool needs_reattach() const noexcept {
    return contains(flags_, RecalcFlags::REATTACH);
  }

  constexpr bool font_units_may_have_changed() const noexcept {
    return contains(flags_, RecalcFlags::FONT_UNITS_CHANGED) ||
           propagate_ == Propagate::RecalcDescendants;
  }

  friend constexpr bool operator==(const StyleRecalcChange &,
                                   const StyleRecalcChange &) = default;

private:
  Propagate propagate_{Propagate::None};
  RecalcFlags flags_{RecalcFlags::NONE};
};

inline constexpr StyleRecalcChange StyleRecalcChange::NONE{};

enum class InheritedGroups : std::uint8_t {
  NONE = 0,
  FONT = 1u << 0,
  TEXT = 1u << 1,
  OTHER = 1u << 2,
};

constexpr InheritedGroups operator|(InheritedGroups a,
                                    InheritedGroups b) noexcept {
  return static_cast<InheritedGroups>(static_cast<std::uint8_t>(a) |
                                      static_cast<std::uint8_t>(b));
}

constexpr InheritedGroups operator&(InheritedGroups a,
                                    InheritedGroups b) noexcept {
  return static_cast<InheritedGroups>(static_cast<std::uint8_t>(a) &
                                      static_cast<std::uint8_t>(b));
}

// Which groups of inherited properties differ between two computed styles.
class InheritedChanges {
public:
  InheritedChanges() = default;

  static InheritedChanges with_groups(InheritedGroups groups) {
    InheritedChanges c;
    c.groups_ = groups;
    return c;
  }

  InheritedGroups groups() const noexcept { return groups_; }

  bool has_changes() const noexcept { return groups_ != InheritedGroups::NONE; }

  bool font_changed() const noexcept {
    return (groups_ & InheritedGroups::FONT) != InheritedGroups::NONE;
  }

  bool text_changed() const noexcept {
    return (groups_ & InheritedGroups::TEXT) != InheritedGroups::NONE;
  }

  InheritedChanges combine(const InheritedChanges &other) const {
    return with_groups(groups_ | other.groups_);
  }

private:
  InheritedGroups groups_{InheritedGroups::NONE};
};

inline const char *to_string(Propagate p) {
  switch (p) {
  case Propagate::None:
    return "None";
  case Propagate::UpdatePseudoElements:
    return "UpdatePseudoElements";
  case Propagate::InheritedOnly:
    return "InheritedOnly";
  case Propagate::RecalcChildren:
    return "RecalcChildren";
  case Propagate::RecalcDescendants:
    return "RecalcDescendants";
  }
  return "?";
}

inline std::string to_string(RecalcFlags flags) {
  static constexpr struct {
    RecalcFlags bit;
    const char *name;
  } names[] = {
      {RecalcFlags::REATTACH, "REATTACH"},
      {RecalcFlags::DISABLED_CHANGED, "DISABLED_CHANGED"},
      {RecalcFlags::SELECTED_CHANGED, "SELECTED_CHANGED"},
      {RecalcFlags::DARK_MODE_CHANGED, "DARK_MODE_CHANGED"},
      {RecalcFlags::RESPONSIVE_CHANGED, "RESPONSIVE_CHANGED"},
      {RecalcFlags::CLASS_CHANGED, "CLASS_CHANGED"},
      {RecalcFlags::SUPPRESS_RECALC, "SUPPRESS_RECALC"},
      {RecalcFlags::FONT_UNITS_CHANGED, "FONT_UNITS_CHANGED"},
  };
  std::string out;
  for (const auto &n : names) {
    if (!contains(flags, n.bit)) {
      continue;
    }
    if (!out.empty()) {
      out += '|';
    }
    out += n.name;
  }
  return out.empty() ? std::string{"NONE"} : out;
}

inline std::ostream &operator<<(std::ostream &os, const StyleRecalcChange &c) {
  return os << "StyleRecalcChange{" << to_string(c.propagate()) << ", "
            << to_string(c.flags()) << "}";
}

inline void dump_recalc_change(std::ostream &os, const StyleRecalcChange &c) {
  os << c << " should_recalc(clean)=" << c.should_recalc(false)
     << " fast_path=" << c.can_use_inherited_fast_path(false)
     << " font_units=" << c.font_units_may_have_changed()
     << " reattach=" << c.needs_reattach() << "\n";
}

} // namespace floem::ui
