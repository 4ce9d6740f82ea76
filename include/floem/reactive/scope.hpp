#pragma once

#include <floem/reactive/effect.hpp>
#include <floem/reactive/memo.hpp>
#include <floem/reactive/signal.hpp>
#include <floem/reactive/trigger.hpp>

#include <memory>
#include <utility>
#include <variant>

namespace floem::reactive {

// A node in the ownership tree. Everything created while a scope is current
// is disposed together with it.
class Scope {
public:
  Scope() : id_{Id::next()} {}

  explicit Scope(Id id) : id_{id} {}

  static Scope current() { return Scope{Runtime::current().current_scope()}; }

  Id id() const noexcept { return id_; }

  Scope create_child() const {
    Scope child;
    Runtime::current().add_child(id_, child.id_);
    return child;
  }

  template <typename F> decltype(auto) enter(F &&f) const {
    ScopeGuard guard{Runtime::current(), id_};
    return std::forward<F>(f)();
  }

  // Each call of the returned function runs f in a fresh child scope and
  // yields the result together with that scope.
  template <typename F> auto enter_child(F f) const {
    return [parent = *this, f = std::move(f)](auto &&...args) {
      const auto child = parent.create_child();
      ScopeGuard guard{Runtime::current(), child.id_};
      auto result = f(std::forward<decltype(args)>(args)...);
      return std::pair{std::move(result), child};
    };
  }

  template <typename T> RwSignal<T> create_rw_signal(T value) const {
    return enter([&] { return RwSignal<T>::create(std::move(value)); });
  }

  template <typename T>
  std::pair<ReadSignal<T>, WriteSignal<T>> create_signal(T value) const {
    return create_rw_signal(std::move(value)).split();
  }

  template <typename T, typename F> Memo<T> create_memo(F f) const {
    return enter([&] { return reactive::create_memo<T>(std::move(f)); });
  }

  Trigger create_trigger() const {
    return enter([] { return Trigger::create(); });
  }

  template <typename F> void create_effect(F f) const {
    enter([&] { reactive::create_effect(std::move(f)); });
  }

  template <typename T, typename F> void create_effect(F f) const {
    enter([&] { reactive::create_effect<T>(std::move(f)); });
  }

  template <typename C, typename U>
  std::invoke_result_t<C &> create_updater(C compute, U on_change) const {
    return enter([&] {
      return reactive::create_updater(std::move(compute), std::move(on_change));
    });
  }

  // Subscribes the running effect to this scope; disposing the scope then
  // disposes the effect as well.
  void track() const {
    auto &rt = Runtime::current();
    auto state = rt.signal(id_);
    if (!state) {
      state = std::make_shared<SignalCell<std::monostate>>(id_, std::monostate{});
      rt.insert_signal(state);
    }
    rt.subscribe(*state);
  }

  void dispose() const { Runtime::current().dispose(id_); }

  friend bool operator==(const Scope &, const Scope &) = default;

private:
  Id id_;
};

template <typename F> decltype(auto) with_scope(const Scope &scope, F &&f) {
  return scope.enter(std::forward<F>(f));
}

template <typename F> auto as_child_of_current_scope(F f) {
  return Scope::current().enter_child(std::move(f));
}

} // namespace floem::reactive
