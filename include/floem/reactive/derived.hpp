#pragma once

#include <floem/reactive/signal.hpp>

#include <optional>
#include <type_traits>
#include <utility>

namespace floem::reactive {

// A view of an RwSignal<T> as a signal of O. Reads map the stored value
// through the getter; writes map O back through the setter and notify the
// underlying signal's subscribers.
template <typename T, typename O, typename GF, typename UF>
class DerivedRwSignal {
public:
  DerivedRwSignal(RwSignal<T> signal, GF getter, UF setter)
      : signal_{signal}, getter_{std::move(getter)},
        setter_{std::move(setter)} {}

  Id id() const noexcept { return signal_.id(); }

  O get() const {
    return signal_.with([&](const T &v) { return O(getter_(v)); });
  }

  O get_untracked() const {
    return signal_.with_untracked([&](const T &v) { return O(getter_(v)); });
  }

  std::optional<O> try_get() const {
    return signal_.try_with([&](const T *v) -> std::optional<O> {
      if (!v) {
        return std::nullopt;
      }
      return O(getter_(*v));
    });
  }

  std::optional<O> try_get_untracked() const {
    return signal_.try_with_untracked([&](const T *v) -> std::optional<O> {
      if (!v) {
        return std::nullopt;
      }
      return O(getter_(*v));
    });
  }

  template <typename F> auto with(F &&f) const {
    return signal_.with([&](const T &v) {
      const O mapped = getter_(v);
      return std::forward<F>(f)(mapped);
    });
  }

  template <typename F> auto with_untracked(F &&f) const {
    return signal_.with_untracked([&](const T &v) {
      const O mapped = getter_(v);
      return std::forward<F>(f)(mapped);
    });
  }

  void track() const { signal_.track(); }

  bool is_disposed() const { return signal_.is_disposed(); }

  void set(O value) const { try_set(std::move(value)); }

  template <typename F> void update(F &&f) const {
    try_update(std::forward<F>(f));
  }

  bool try_set(O value) const {
    return signal_.try_update([&](T &v) { v = setter_(value); });
  }

  // f mutates the mapped value; the result is mapped back and stored.
  template <typename F> bool try_update(F &&f) const {
    return signal_.try_update([&](T &v) {
      O mapped = getter_(v);
      std::forward<F>(f)(mapped);
      v = setter_(mapped);
    });
  }

  RwSignal<T> source() const noexcept { return signal_; }

private:
  RwSignal<T> signal_;
  GF getter_;
  UF setter_;
};

template <typename T, typename GF, typename UF>
auto create_derived_rw_signal(RwSignal<T> signal, GF getter, UF setter) {
  using O = std::decay_t<std::invoke_result_t<GF &, const T &>>;
  return DerivedRwSignal<T, O, GF, UF>{signal, std::move(getter),
                                       std::move(setter)};
}

} // namespace floem::reactive
