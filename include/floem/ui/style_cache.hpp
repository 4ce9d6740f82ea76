#pragma once

#include <floem/log.hpp>
#include <floem/ui/selectors.hpp>
#include <floem/ui/style.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace floem::ui {

namespace detail {

inline std::size_t hash_mix(std::size_t seed, std::size_t v) noexcept {
  return seed ^ (v + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

inline std::size_t hash_prop_value(const PropValue &v) {
  const std::size_t payload = std::visit(
      [](const auto &x) -> std::size_t {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, Length>) {
          return hash_mix(std::hash<double>{}(x.value),
                          static_cast<std::size_t>(x.unit));
        } else if constexpr (std::is_same_v<T, ColorU8>) {
          return std::hash<std::uint32_t>{}(
              (std::uint32_t{x.r} << 24) | (std::uint32_t{x.g} << 16) |
              (std::uint32_t{x.b} << 8) | std::uint32_t{x.a});
        } else {
          return std::hash<T>{}(x);
        }
      },
      v);
  return hash_mix(v.index(), payload);
}

} // namespace detail

// Content hash of a style. Property order does not matter; sub-map order
// does, as it does for operator==.
inline std::size_t hash_style(const Style &s) {
  std::size_t props = 0;
  for (const auto &kv : s.props()) {
    props += detail::hash_mix(std::hash<std::string>{}(kv.first),
                              detail::hash_prop_value(kv.second));
  }
  std::size_t h = detail::hash_mix(0, props);
  for (const auto &kv : s.selector_styles()) {
    h = detail::hash_mix(h, static_cast<std::size_t>(kv.first));
    h = detail::hash_mix(h, hash_style(kv.second));
  }
  for (const auto &kv : s.responsive_styles()) {
    h = detail::hash_mix(h, 0x100u + static_cast<std::size_t>(kv.first));
    h = detail::hash_mix(h, hash_style(kv.second));
  }
  for (const auto &kv : s.class_defs()) {
    h = detail::hash_mix(h, std::hash<std::string>{}(kv.first));
    h = detail::hash_mix(h, hash_style(kv.second));
  }
  return h;
}

inline std::uint16_t interaction_bits(const InteractionState &st) noexcept {
  std::uint16_t bits = 0;
  const bool flags[] = {st.hovered,  st.selected, st.disabled,
                        st.focused,  st.active,   st.dark_mode,
                        st.dragging, st.focus_visible};
  for (std::size_t i = 0; i < std::size(flags); ++i) {
    if (flags[i]) {
      bits = static_cast<std::uint16_t>(bits | (1u << i));
    }
  }
  return bits;
}

// Inputs of one full style resolution. `matched` holds only the class
// definitions the view's classes picked up from its ancestors.
struct StyleCacheKey {
  Style stacked;
  std::uint16_t interaction{0};
  ScreenSizeBp screen_size{ScreenSizeBp::Xs};
  std::vector<std::string> classes;
  Style matched;
  std::size_t hash{0};

  friend bool operator==(const StyleCacheKey &a, const StyleCacheKey &b) {
    return a.hash == b.hash && a.interaction == b.interaction &&
           a.screen_size == b.screen_size && a.classes == b.classes &&
           a.stacked == b.stacked && a.matched == b.matched;
  }
};

struct StyleCacheKeyHash {
  std::size_t operator()(const StyleCacheKey &k) const noexcept {
    return k.hash;
  }
};

inline StyleCacheKey make_style_cache_key(Style stacked,
                                          const InteractionState &st,
                                          const std::vector<std::string> &classes,
                                          const Style &class_defs) {
  StyleCacheKey key;
  key.stacked = std::move(stacked);
  key.interaction = interaction_bits(st);
  key.screen_size = st.screen_size_bp;
  key.classes = classes;
  for (const auto &cls : classes) {
    if (const auto *def = class_defs.class_style(cls)) {
      key.matched.class_def(cls, *def);
    }
  }

  std::size_t h = hash_style(key.stacked);
  h = detail::hash_mix(h, key.interaction);
  h = detail::hash_mix(h, static_cast<std::size_t>(key.screen_size));
  for (const auto &cls : key.classes) {
    h = detail::hash_mix(h, std::hash<std::string>{}(cls));
  }
  key.hash = detail::hash_mix(h, hash_style(key.matched));
  return key;
}

// Output of a full resolution, shared by every view that resolves the same
// inputs.
struct ResolvedStyle {
  Style combined;
  StyleSelectors selectors;
};

// Bounded map from resolution inputs to results. When full, the least
// recently used quarter is evicted.
class StyleCache {
public:
  static constexpr std::size_t max_entries = 256;

  std::shared_ptr<const ResolvedStyle> get(const StyleCacheKey &key) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
      ++misses_;
      return nullptr;
    }
    ++hits_;
    it->second.last_access = ++clock_;
    return it->second.resolved;
  }

  std::shared_ptr<const ResolvedStyle> insert(StyleCacheKey key,
                                              ResolvedStyle resolved) {
    if (entries_.size() >= max_entries) {
      evict_oldest();
    }
    auto shared = std::make_shared<const ResolvedStyle>(std::move(resolved));
    entries_.insert_or_assign(std::move(key), Entry{shared, ++clock_});
    return shared;
  }

  void clear() {
    entries_.clear();
    clock_ = 0;
  }

  std::size_t size() const noexcept { return entries_.size(); }
  std::uint64_t hits() const noexcept { return hits_; }
  std::uint64_t misses() const noexcept { return misses_; }

private:
  struct Entry {
    std::shared_ptr<const ResolvedStyle> resolved;
    std::uint64_t last_access{0};
  };

  void evict_oldest() {
    using Iter = decltype(entries_)::iterator;
    std::vector<std::pair<std::uint64_t, Iter>> order;
    order.reserve(entries_.size());
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
      order.emplace_back(it->second.last_access, it);
    }
    const auto n = std::min(max_entries / 4, order.size());
    std::nth_element(order.begin(), order.begin() + n, order.end(),
                     [](const auto &a, const auto &b) { return a.first < b.first; });
    for (std::size_t i = 0; i < n; ++i) {
      entries_.erase(order[i].second);
    }
    floem_log("style cache evicted " + std::to_string(n), "StylePass");
  }

  std::unordered_map<StyleCacheKey, Entry, StyleCacheKeyHash> entries_;
  std::uint64_t clock_{0};
  std::uint64_t hits_{0};
  std::uint64_t misses_{0};
};

} // namespace floem::ui
