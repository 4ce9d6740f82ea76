#pragma once

#include <floem/log.hpp>
#include <floem/reactive/borrow.hpp>
#include <floem/reactive/id.hpp>

#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace floem::reactive {

class SignalDisposed : public std::logic_error {
public:
  explicit SignalDisposed(Id id)
      : std::logic_error{"signal " + std::to_string(id.raw) +
                         " has been disposed"} {}
};

// Untyped part of a signal: identity and the effects subscribed to it.
// Subscribers keep insertion order so cascades are deterministic.
class SignalState {
public:
  explicit SignalState(Id id) : id_{id} {}
  virtual ~SignalState() = default;

  SignalState(const SignalState &) = delete;
  SignalState &operator=(const SignalState &) = delete;

  Id id() const noexcept { return id_; }

  void add_subscriber(Id effect) {
    if (std::find(subscribers_.begin(), subscribers_.end(), effect) ==
        subscribers_.end()) {
      subscribers_.push_back(effect);
    }
  }

  void remove_subscriber(Id effect) {
    subscribers_.erase(
        std::remove(subscribers_.begin(), subscribers_.end(), effect),
        subscribers_.end());
  }

  const std::vector<Id> &subscribers() const noexcept { return subscribers_; }

private:
  Id id_;
  std::vector<Id> subscribers_{};
};

class EffectBase {
public:
  explicit EffectBase(Id id) : id_{id} {}
  virtual ~EffectBase() = default;

  EffectBase(const EffectBase &) = delete;
  EffectBase &operator=(const EffectBase &) = delete;

  Id id() const noexcept { return id_; }

  virtual void run() = 0;

  void add_observer(Id signal) {
    if (std::find(observers_.begin(), observers_.end(), signal) ==
        observers_.end()) {
      observers_.push_back(signal);
    }
  }

  std::vector<Id> take_observers() { return std::exchange(observers_, {}); }

  const std::vector<Id> &observers() const noexcept { return observers_; }

private:
  Id id_;
  std::vector<Id> observers_{};
};

class Runtime;

namespace detail {
inline thread_local Runtime *active_runtime = nullptr;
} // namespace detail

// Owns every signal, effect, scope edge and context value created on one
// thread. Table accesses go through borrow flags; no flag is held while user
// code runs.
class Runtime {
public:
  Runtime() : current_scope_{Id::next()} {}

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  static Runtime &current();

  Id current_scope() const noexcept { return current_scope_; }

  const std::shared_ptr<EffectBase> &current_effect() const noexcept {
    return current_effect_;
  }

  std::size_t signal_count() const {
    SharedBorrow b{signals_flag_, "signal table"};
    return signals_.size();
  }

  std::size_t effect_count() const {
    SharedBorrow b{effects_flag_, "effect table"};
    return effects_.size();
  }

  bool has_children(Id id) const {
    SharedBorrow b{children_flag_, "scope table"};
    const auto it = children_.find(id);
    return it != children_.end() && !it->second.empty();
  }

  std::size_t child_count(Id id) const {
    SharedBorrow b{children_flag_, "scope table"};
    const auto it = children_.find(id);
    return it == children_.end() ? 0 : it->second.size();
  }

  std::optional<Id> parent_of(Id id) const {
    SharedBorrow b{children_flag_, "scope table"};
    const auto it = parents_.find(id);
    if (it == parents_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // A child has one parent; re-adding it elsewhere moves it.
  void add_child(Id parent, Id child) {
    MutBorrow b{children_flag_, "scope table"};
    unlink_from_parent(child);
    children_[parent].insert(child);
    parents_.insert_or_assign(child, parent);
  }

  // Registers the id as a child of the current scope.
  void set_scope(Id id) { add_child(current_scope_, id); }

  void insert_signal(std::shared_ptr<SignalState> state) {
    const auto id = state->id();
    MutBorrow b{signals_flag_, "signal table"};
    signals_.insert_or_assign(id, std::move(state));
  }

  std::shared_ptr<SignalState> signal(Id id) const {
    SharedBorrow b{signals_flag_, "signal table"};
    const auto it = signals_.find(id);
    if (it == signals_.end()) {
      return nullptr;
    }
    return it->second;
  }

  void insert_effect(std::shared_ptr<EffectBase> effect) {
    const auto id = effect->id();
    MutBorrow b{effects_flag_, "effect table"};
    effects_.insert_or_assign(id, std::move(effect));
  }

  std::shared_ptr<EffectBase> effect(Id id) const {
    SharedBorrow b{effects_flag_, "effect table"};
    const auto it = effects_.find(id);
    if (it == effects_.end()) {
      return nullptr;
    }
    return it->second;
  }

  // Links the running effect and the signal in both directions.
  void subscribe(SignalState &state) {
    if (!current_effect_) {
      return;
    }
    state.add_subscriber(current_effect_->id());
    current_effect_->add_observer(state.id());
  }

  void observer_clean_up(EffectBase &effect) {
    for (const auto signal_id : effect.take_observers()) {
      if (auto state = signal(signal_id)) {
        state->remove_subscriber(effect.id());
      }
    }
  }

  void run_effect(const std::shared_ptr<EffectBase> &effect);

  void run_subscribers(const SignalState &state) {
    const auto snapshot = state.subscribers();
    for (const auto effect_id : snapshot) {
      if (auto e = effect(effect_id)) {
        run_effect(e);
      }
    }
  }

  void dispose(Id id);

  void dispose_children(Id id) {
    std::unordered_set<Id> children;
    {
      MutBorrow b{children_flag_, "scope table"};
      auto node = children_.extract(id);
      if (!node.empty()) {
        children = std::move(node.mapped());
      }
    }
    for (const auto child : children) {
      dispose(child);
    }
  }

  template <typename T> void provide_context(T value) {
    auto boxed = std::make_shared<T>(std::move(value));
    MutBorrow b{contexts_flag_, "context table"};
    contexts_.insert_or_assign(std::type_index{typeid(T)}, std::move(boxed));
  }

  template <typename T> std::optional<T> use_context() const {
    SharedBorrow b{contexts_flag_, "context table"};
    const auto it = contexts_.find(std::type_index{typeid(T)});
    if (it == contexts_.end()) {
      return std::nullopt;
    }
    return *std::static_pointer_cast<T>(it->second);
  }

private:
  friend class ScopeGuard;
  friend class EffectGuard;

  // Caller holds the scope table borrow.
  void unlink_from_parent(Id child) {
    auto node = parents_.extract(child);
    if (node.empty()) {
      return;
    }
    const auto it = children_.find(node.mapped());
    if (it == children_.end()) {
      return;
    }
    it->second.erase(child);
    if (it->second.empty()) {
      children_.erase(it);
    }
  }

  Id current_scope_;
  std::shared_ptr<EffectBase> current_effect_{};

  BorrowFlag signals_flag_{};
  std::unordered_map<Id, std::shared_ptr<SignalState>> signals_{};

  BorrowFlag effects_flag_{};
  std::unordered_map<Id, std::shared_ptr<EffectBase>> effects_{};

  BorrowFlag children_flag_{};
  std::unordered_map<Id, std::unordered_set<Id>> children_{};
  std::unordered_map<Id, Id> parents_{};

  BorrowFlag contexts_flag_{};
  std::unordered_map<std::type_index, std::shared_ptr<void>> contexts_{};
};

inline Runtime &Runtime::current() {
  if (detail::active_runtime) {
    return *detail::active_runtime;
  }
  thread_local Runtime fallback;
  return fallback;
}

// Installs a fresh runtime on this thread until destroyed.
class RuntimeGuard {
public:
  RuntimeGuard()
      : runtime_{std::make_unique<Runtime>()},
        prev_{std::exchange(detail::active_runtime, runtime_.get())} {}

  RuntimeGuard(const RuntimeGuard &) = delete;
  RuntimeGuard &operator=(const RuntimeGuard &) = delete;

  ~RuntimeGuard() { detail::active_runtime = prev_; }

  Runtime &runtime() noexcept { return *runtime_; }

private:
  std::unique_ptr<Runtime> runtime_;
  Runtime *prev_;
};

class ScopeGuard {
public:
  ScopeGuard(Runtime &rt, Id scope)
      : rt_{rt}, prev_{std::exchange(rt.current_scope_, scope)} {}

  ScopeGuard(const ScopeGuard &) = delete;
  ScopeGuard &operator=(const ScopeGuard &) = delete;

  ~ScopeGuard() { rt_.current_scope_ = prev_; }

private:
  Runtime &rt_;
  Id prev_;
};

class EffectGuard {
public:
  EffectGuard(Runtime &rt, std::shared_ptr<EffectBase> effect)
      : rt_{rt}, prev_{std::exchange(rt.current_effect_, std::move(effect))} {}

  EffectGuard(const EffectGuard &) = delete;
  EffectGuard &operator=(const EffectGuard &) = delete;

  ~EffectGuard() { rt_.current_effect_ = std::move(prev_); }

private:
  Runtime &rt_;
  std::shared_ptr<EffectBase> prev_;
};

inline void Runtime::run_effect(const std::shared_ptr<EffectBase> &effect) {
  dispose_children(effect->id());
  observer_clean_up(*effect);

  EffectGuard effect_guard{*this, effect};
  ScopeGuard scope_guard{*this, effect->id()};
  effect->run();
}

inline void Runtime::dispose(Id id) {
  std::unordered_set<Id> children;
  std::shared_ptr<SignalState> signal;
  std::shared_ptr<EffectBase> effect;
  {
    MutBorrow b{children_flag_, "scope table"};
    auto node = children_.extract(id);
    if (!node.empty()) {
      children = std::move(node.mapped());
    }
    unlink_from_parent(id);
  }
  {
    MutBorrow b{signals_flag_, "signal table"};
    auto node = signals_.extract(id);
    if (!node.empty()) {
      signal = std::move(node.mapped());
    }
  }
  {
    MutBorrow b{effects_flag_, "effect table"};
    auto node = effects_.extract(id);
    if (!node.empty()) {
      effect = std::move(node.mapped());
    }
  }

  if (signal || effect || !children.empty()) {
    floem_log("dispose " + std::to_string(id.raw) + " children=" +
                  std::to_string(children.size()),
              "Reactive");
  }

  for (const auto child : children) {
    dispose(child);
  }
  if (effect) {
    observer_clean_up(*effect);
  }
  if (signal) {
    // An effect subscribed to a vanished signal would keep a dangling edge.
    for (const auto subscriber : signal->subscribers()) {
      dispose(subscriber);
    }
  }
}

inline bool Id::has_signal() const {
  return Runtime::current().signal(*this) != nullptr;
}

// Runs f with no current effect, so its reads create no subscriptions.
template <typename F> decltype(auto) untrack(F &&f) {
  EffectGuard guard{Runtime::current(), nullptr};
  return std::forward<F>(f)();
}

} // namespace floem::reactive
