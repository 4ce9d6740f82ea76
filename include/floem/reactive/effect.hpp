#pragma once

#include <floem/reactive/runtime.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace floem::reactive {

// Effect whose closure receives the value it returned on the previous run.
template <typename T, typename F> class Effect final : public EffectBase {
public:
  Effect(Id id, F f) : EffectBase{id}, f_{std::move(f)} {}

  void run() override {
    auto prev = std::exchange(value_, std::nullopt);
    value_.emplace(f_(std::move(prev)));
  }

private:
  F f_;
  std::optional<T> value_{};
};

template <typename F> class UnitEffect final : public EffectBase {
public:
  UnitEffect(Id id, F f) : EffectBase{id}, f_{std::move(f)} {}

  void run() override { f_(); }

private:
  F f_;
};

namespace detail {

template <typename E> void register_and_run(std::shared_ptr<E> effect) {
  auto &rt = Runtime::current();
  rt.insert_effect(effect);
  rt.set_scope(effect->id());
  rt.run_effect(effect);
}

} // namespace detail

template <typename F,
          typename = std::enable_if_t<std::is_invocable_v<std::decay_t<F> &>>>
void create_effect(F &&f) {
  using Fn = std::decay_t<F>;
  detail::register_and_run(
      std::make_shared<UnitEffect<Fn>>(Id::next(), std::forward<F>(f)));
}

template <typename T, typename F,
          typename = std::enable_if_t<
              std::is_invocable_r_v<T, std::decay_t<F> &, std::optional<T>>>>
void create_effect(F &&f) {
  using Fn = std::decay_t<F>;
  detail::register_and_run(
      std::make_shared<Effect<T, Fn>>(Id::next(), std::forward<F>(f)));
}

// Runs compute tracked and returns its first result. Later dependency changes
// run compute again and hand the result to on_change outside any tracking.
template <typename C, typename U>
std::invoke_result_t<C &> create_updater(C compute, U on_change) {
  using R = std::invoke_result_t<C &>;
  auto initial = std::make_shared<std::optional<R>>();
  create_effect<bool>([compute = std::move(compute),
                       on_change = std::move(on_change),
                       initial](std::optional<bool> ran) mutable {
    auto value = compute();
    if (!ran) {
      initial->emplace(std::move(value));
    } else {
      untrack([&] { on_change(std::move(value)); });
    }
    return true;
  });
  R out = std::move(**initial);
  initial->reset();
  return out;
}

// Like create_updater, but compute also threads a state value through the
// runs. compute gets the previous state and returns {result, state};
// on_change receives both on later runs and returns the state to keep.
template <typename S, typename C, typename U>
auto create_stateful_updater(C compute, U on_change) {
  using R = typename std::invoke_result_t<C &, std::optional<S>>::first_type;
  auto initial = std::make_shared<std::optional<R>>();
  create_effect<S>([compute = std::move(compute),
                    on_change = std::move(on_change), initial,
                    first = true](std::optional<S> prev) mutable -> S {
    auto out = compute(std::move(prev));
    if (std::exchange(first, false)) {
      initial->emplace(std::move(out.first));
      return std::move(out.second);
    }
    return untrack([&] {
      return S(on_change(std::move(out.first), std::move(out.second)));
    });
  });
  R out = std::move(**initial);
  initial->reset();
  return out;
}

namespace detail {

class TrackerEffect final : public EffectBase {
public:
  TrackerEffect(Id id, std::function<void()> on_change)
      : EffectBase{id}, on_change_{std::move(on_change)} {}

  void run() override { untrack(on_change_); }

private:
  std::function<void()> on_change_;
};

} // namespace detail

// Records the signals read inside track() and calls on_change when one of
// them changes, without re-running the tracked closure. After a change the
// tracker is idle until track() is called again. Destroying the tracker
// disposes its subscriptions.
class SignalTracker {
public:
  explicit SignalTracker(std::function<void()> on_change) : id_{Id::next()} {
    auto &rt = Runtime::current();
    rt.insert_effect(
        std::make_shared<detail::TrackerEffect>(id_, std::move(on_change)));
    rt.set_scope(id_);
  }

  SignalTracker(const SignalTracker &) = delete;
  SignalTracker &operator=(const SignalTracker &) = delete;

  SignalTracker(SignalTracker &&other) noexcept
      : id_{std::exchange(other.id_, Id{})} {}

  SignalTracker &operator=(SignalTracker &&other) {
    if (this != &other) {
      release();
      id_ = std::exchange(other.id_, Id{});
    }
    return *this;
  }

  ~SignalTracker() { release(); }

  Id id() const noexcept { return id_; }

  template <typename F> decltype(auto) track(F &&f) const {
    auto &rt = Runtime::current();
    auto effect = id_.raw == 0 ? nullptr : rt.effect(id_);
    if (!effect) {
      return untrack(std::forward<F>(f));
    }
    rt.dispose_children(id_);
    rt.observer_clean_up(*effect);
    EffectGuard effect_guard{rt, effect};
    ScopeGuard scope_guard{rt, id_};
    return std::forward<F>(f)();
  }

private:
  void release() {
    if (id_.raw == 0) {
      return;
    }
    Runtime::current().dispose(std::exchange(id_, Id{}));
  }

  Id id_;
};

template <typename F> SignalTracker create_tracker(F on_change) {
  return SignalTracker{std::function<void()>{std::move(on_change)}};
}

} // namespace floem::reactive
