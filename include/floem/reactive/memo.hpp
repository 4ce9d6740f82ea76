#pragma once

#include <floem/reactive/effect.hpp>
#include <floem/reactive/signal.hpp>

#include <type_traits>
#include <utility>

namespace floem::reactive {

// Read-only derived signal. Subscribers only re-run when the recomputed value
// compares unequal to the stored one.
template <typename T> class Memo : public SignalReadOps<Memo<T>, T> {
public:
  Id id() const noexcept { return id_; }

  friend bool operator==(const Memo &a, const Memo &b) noexcept {
    return a.id_ == b.id_;
  }

private:
  friend struct detail::SignalFactory;
  explicit Memo(Id id) : id_{id} {}

  Id id_;
};

template <typename T, typename F> Memo<T> create_memo(F f) {
  static_assert(std::is_invocable_r_v<T, F &, const T *>,
                "memo function must map const T* to T");
  auto signal = RwSignal<T>::create(f(static_cast<const T *>(nullptr)));

  create_effect([f = std::move(f), signal]() mutable {
    T next = signal.with_untracked([&](const T &prev) { return f(&prev); });
    const bool changed =
        signal.with_untracked([&](const T &prev) { return !(prev == next); });
    if (changed) {
      signal.set(std::move(next));
    }
  });

  return detail::SignalFactory::wrap<Memo<T>>(signal.id());
}

} // namespace floem::reactive
