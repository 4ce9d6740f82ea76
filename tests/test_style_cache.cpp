#include <floem/ui/style_cache.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace floem::ui;

namespace {

constexpr ColorU8 red{255, 0, 0, 255};
constexpr ColorU8 blue{0, 0, 255, 255};

StyleCacheKey key_for(const Style &s, const InteractionState &st = {},
                      const std::vector<std::string> &classes = {},
                      const Style &defs = {}) {
  return make_style_cache_key(s, st, classes, defs);
}

} // namespace

TEST(StyleCache, SameInputsShareOneResult) {
  StyleCache cache;
  const auto style = Style{}.background(red).hover(Style{}.background(blue));
  EXPECT_TRUE(cache.get(key_for(style)) == nullptr);
  const auto stored =
      cache.insert(key_for(style), ResolvedStyle{style.resolve({}), style.selectors()});

  const auto again = cache.get(key_for(Style{}.background(red).hover(Style{}.background(blue))));
  ASSERT_TRUE(again != nullptr);
  EXPECT_EQ(again.get(), stored.get());
  EXPECT_EQ(cache.hits(), 1u);
  EXPECT_EQ(cache.misses(), 1u);
  EXPECT_EQ(cache.size(), 1u);
}

TEST(StyleCache, InteractionBreakpointAndClassesAreKeyed) {
  const auto style = Style{}.background(red);
  InteractionState hovered;
  hovered.hovered = true;
  InteractionState wide;
  wide.screen_size_bp = ScreenSizeBp::Lg;
  const auto defs = Style{}.class_def("item", Style{}.set("opacity", 0.5));

  const auto base = key_for(style);
  EXPECT_FALSE(base == key_for(style, hovered));
  EXPECT_FALSE(base == key_for(style, wide));
  EXPECT_FALSE(base == key_for(style, {}, {"item"}));
  EXPECT_FALSE(key_for(style, {}, {"item"}) == key_for(style, {}, {"item"}, defs));
  EXPECT_TRUE(key_for(style, {}, {"item"}, defs) ==
              key_for(style, {}, {"item"},
                      defs.applied(Style{}.class_def("other", Style{}.background(blue)))));
}

TEST(StyleCache, PropertyOrderDoesNotMatter) {
  const auto a = Style{}.set("opacity", 0.5).set("z_index", 2);
  const auto b = Style{}.set("z_index", 2).set("opacity", 0.5);
  EXPECT_EQ(hash_style(a), hash_style(b));
  EXPECT_TRUE(key_for(a) == key_for(b));
  EXPECT_NE(hash_style(a), hash_style(Style{}.set("opacity", 0.25).set("z_index", 2)));
}

TEST(StyleCache, EvictsTheLeastRecentlyUsedQuarter) {
  StyleCache cache;
  for (int i = 0; i < static_cast<int>(StyleCache::max_entries); ++i) {
    const auto s = Style{}.set("z_index", i);
    cache.insert(key_for(s), ResolvedStyle{s, {}});
  }
  ASSERT_EQ(cache.size(), StyleCache::max_entries);
  ASSERT_TRUE(cache.get(key_for(Style{}.set("z_index", 0))) != nullptr);

  const auto extra = Style{}.set("z_index", -1);
  cache.insert(key_for(extra), ResolvedStyle{extra, {}});
  EXPECT_EQ(cache.size(), StyleCache::max_entries - StyleCache::max_entries / 4 + 1);
  EXPECT_TRUE(cache.get(key_for(Style{}.set("z_index", 0))) != nullptr);
  EXPECT_TRUE(cache.get(key_for(Style{}.set("z_index", 1))) == nullptr);
  EXPECT_TRUE(cache.get(key_for(extra)) != nullptr);

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
}
