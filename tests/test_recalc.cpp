#include <floem/ui/recalc.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <sstream>

using namespace floem::ui;

namespace {

constexpr std::array<Propagate, 5> all_levels{
    Propagate::None, Propagate::UpdatePseudoElements, Propagate::InheritedOnly,
    Propagate::RecalcChildren, Propagate::RecalcDescendants};

constexpr std::array<RecalcFlags, 9> sample_flags{
    RecalcFlags::NONE,
    RecalcFlags::REATTACH,
    RecalcFlags::DISABLED_CHANGED,
    RecalcFlags::SELECTED_CHANGED,
    RecalcFlags::DARK_MODE_CHANGED,
    RecalcFlags::RESPONSIVE_CHANGED,
    RecalcFlags::CLASS_CHANGED,
    RecalcFlags::SUPPRESS_RECALC,
    RecalcFlags::FONT_UNITS_CHANGED | RecalcFlags::REATTACH};

} // namespace

TEST(Propagate, LevelsAreTotallyOrdered) {
  for (std::size_t i = 0; i + 1 < all_levels.size(); ++i) {
    EXPECT_LT(all_levels[i], all_levels[i + 1]);
  }
}

TEST(Propagate, TraversalPredicates) {
  EXPECT_FALSE(requires_child_traversal(Propagate::None));
  EXPECT_TRUE(requires_child_traversal(Propagate::UpdatePseudoElements));
  EXPECT_FALSE(requires_full_resolution(Propagate::InheritedOnly));
  EXPECT_TRUE(requires_full_resolution(Propagate::RecalcChildren));
  EXPECT_TRUE(requires_full_resolution(Propagate::RecalcDescendants));
  EXPECT_TRUE(is_recursive(Propagate::RecalcDescendants));
  EXPECT_FALSE(is_recursive(Propagate::RecalcChildren));
}

TEST(StyleRecalcChange, DefaultIsEmpty) {
  EXPECT_TRUE(StyleRecalcChange{}.is_empty());
  EXPECT_EQ(StyleRecalcChange{}, StyleRecalcChange::NONE);
  EXPECT_FALSE(StyleRecalcChange{Propagate::InheritedOnly}.is_empty());
  EXPECT_FALSE(StyleRecalcChange::NONE.with_flags(RecalcFlags::REATTACH).is_empty());
}

TEST(StyleRecalcChange, CombineTakesMaxLevelAndUnionOfFlags) {
  for (const auto a : all_levels) {
    for (const auto b : all_levels) {
      for (const auto fa : sample_flags) {
        for (const auto fb : sample_flags) {
          const auto c = StyleRecalcChange{a, fa}.combine(StyleRecalcChange{b, fb});
          EXPECT_EQ(c.propagate(), std::max(a, b));
          EXPECT_EQ(c.flags(), fa | fb);
        }
      }
    }
  }
}

TEST(StyleRecalcChange, ForChildrenKeepsOnlyStickyLevels) {
  for (const auto level : all_levels) {
    const StyleRecalcChange c{level, RecalcFlags::CLASS_CHANGED};
    const auto child = c.for_children();
    if (level == Propagate::RecalcDescendants || level == Propagate::InheritedOnly) {
      EXPECT_EQ(child.propagate(), level);
      EXPECT_EQ(child.for_children().propagate(), level);
    } else {
      EXPECT_EQ(child.propagate(), Propagate::None);
    }
    EXPECT_EQ(child.flags(), RecalcFlags::CLASS_CHANGED);
  }
}

TEST(StyleRecalcChange, ForChildrenDropsSuppression) {
  const auto c = StyleRecalcChange{Propagate::RecalcDescendants}.with_flags(
      RecalcFlags::SUPPRESS_RECALC | RecalcFlags::REATTACH);
  const auto child = c.for_children();
  EXPECT_FALSE(contains(child.flags(), RecalcFlags::SUPPRESS_RECALC));
  EXPECT_TRUE(child.needs_reattach());
  EXPECT_TRUE(child.should_recalc(false));
}

TEST(StyleRecalcChange, SelectorsAlwaysBlockFastPath) {
  for (const auto level : all_levels) {
    for (const auto f : sample_flags) {
      EXPECT_FALSE(StyleRecalcChange(level, f).can_use_inherited_fast_path(true));
    }
  }
  EXPECT_FALSE(StyleRecalcChange{Propagate::RecalcChildren}.can_use_inherited_fast_path(false));
  EXPECT_FALSE(StyleRecalcChange{Propagate::None}.can_use_inherited_fast_path(false));
}

TEST(StyleRecalcChange, FlagGatedFastPath) {
  const StyleRecalcChange inherited{Propagate::InheritedOnly};
  EXPECT_TRUE(inherited.can_use_inherited_fast_path(false));
  EXPECT_FALSE(inherited.with_flags(RecalcFlags::CLASS_CHANGED).can_use_inherited_fast_path(false));
  EXPECT_FALSE(inherited.with_flags(RecalcFlags::DISABLED_CHANGED).can_use_inherited_fast_path(false));
  EXPECT_FALSE(inherited.with_flags(RecalcFlags::SELECTED_CHANGED).can_use_inherited_fast_path(false));
  EXPECT_FALSE(inherited.with_flags(RecalcFlags::DARK_MODE_CHANGED).can_use_inherited_fast_path(false));
  EXPECT_TRUE(inherited.with_flags(RecalcFlags::FONT_UNITS_CHANGED).can_use_inherited_fast_path(false));
  EXPECT_TRUE(inherited.with_flags(RecalcFlags::RESPONSIVE_CHANGED).can_use_inherited_fast_path(false));
}

TEST(StyleRecalcChange, SuppressionOverridesDirtiness) {
  const auto c = StyleRecalcChange{Propagate::RecalcChildren}.with_flags(RecalcFlags::SUPPRESS_RECALC);
  EXPECT_FALSE(c.should_recalc(true));
  EXPECT_FALSE(c.should_recalc(false));
}

TEST(StyleRecalcChange, ShouldRecalc) {
  EXPECT_FALSE(StyleRecalcChange::NONE.should_recalc(false));
  EXPECT_TRUE(StyleRecalcChange::NONE.should_recalc(true));
  EXPECT_TRUE(StyleRecalcChange{Propagate::UpdatePseudoElements}.should_recalc(false));
}

TEST(StyleRecalcChange, ForceHelpers) {
  const StyleRecalcChange base{Propagate::InheritedOnly, RecalcFlags::CLASS_CHANGED};
  EXPECT_EQ(base.force_recalc_descendants().propagate(), Propagate::RecalcDescendants);
  EXPECT_EQ(base.force_recalc_descendants().flags(), RecalcFlags::CLASS_CHANGED);
  EXPECT_EQ(base.force_recalc_children().propagate(), Propagate::RecalcChildren);
  EXPECT_EQ(StyleRecalcChange{Propagate::RecalcDescendants}.force_recalc_children().propagate(),
            Propagate::RecalcDescendants);
  EXPECT_TRUE(base.force_reattach().needs_reattach());
  EXPECT_FALSE(base.needs_reattach());
  EXPECT_EQ(base.ensure_at_least(Propagate::UpdatePseudoElements).propagate(),
            Propagate::InheritedOnly);
}

TEST(StyleRecalcChange, FontUnits) {
  EXPECT_TRUE(StyleRecalcChange{Propagate::RecalcDescendants}.font_units_may_have_changed());
  EXPECT_FALSE(StyleRecalcChange{Propagate::RecalcChildren}.font_units_may_have_changed());
  EXPECT_TRUE(StyleRecalcChange::NONE.with_flags(RecalcFlags::FONT_UNITS_CHANGED)
                  .font_units_may_have_changed());
}

TEST(StyleRecalcChange, IsUsableInConstantExpressions) {
  constexpr auto c = StyleRecalcChange{Propagate::InheritedOnly}.combine(
      StyleRecalcChange{Propagate::RecalcChildren, RecalcFlags::REATTACH});
  static_assert(c.propagate() == Propagate::RecalcChildren);
  static_assert(c.needs_reattach());
  SUCCEED();
}

TEST(InheritedChanges, Groups) {
  InheritedChanges none;
  EXPECT_FALSE(none.has_changes());
  const auto font = InheritedChanges::with_groups(InheritedGroups::FONT);
  EXPECT_TRUE(font.font_changed());
  EXPECT_FALSE(font.text_changed());
  const auto both = font.combine(InheritedChanges::with_groups(InheritedGroups::TEXT));
  EXPECT_TRUE(both.font_changed());
  EXPECT_TRUE(both.text_changed());
}

TEST(RecalcDiagnostics, Printing) {
  EXPECT_STREQ(to_string(Propagate::InheritedOnly), "InheritedOnly");
  EXPECT_EQ(to_string(RecalcFlags::NONE), "NONE");
  EXPECT_EQ(to_string(RecalcFlags::REATTACH | RecalcFlags::CLASS_CHANGED), "REATTACH|CLASS_CHANGED");

  std::ostringstream os;
  os << StyleRecalcChange{Propagate::RecalcChildren, RecalcFlags::DARK_MODE_CHANGED};
  EXPECT_EQ(os.str(), "StyleRecalcChange{RecalcChildren, DARK_MODE_CHANGED}");

  std::ostringstream dump;
  dump_recalc_change(dump, StyleRecalcChange{Propagate::InheritedOnly});
  EXPECT_NE(dump.str().find("fast_path=1"), std::string::npos);
}
