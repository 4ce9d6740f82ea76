#pragma once

#include <floem/reactive/borrow.hpp>
#include <floem/reactive/id.hpp>
#include <floem/reactive/runtime.hpp>

#include <memory>
#include <optional>
#include <utility>

namespace floem::reactive {

template <typename T> class SignalCell final : public SignalState {
public:
  SignalCell(Id id, T value) : SignalState{id}, value_{std::move(value)} {}

  template <typename F> auto with(F &&f) const {
    SharedBorrow b{flag_, "signal value"};
    return std::forward<F>(f)(std::as_const(value_));
  }

  template <typename F> auto update(F &&f) {
    MutBorrow b{flag_, "signal value"};
    return std::forward<F>(f)(value_);
  }

private:
  T value_;
  BorrowFlag flag_{};
};

template <typename T> class ReadSignal;
template <typename T> class WriteSignal;
template <typename T> class RwSignal;

namespace detail {

// The only way to turn a raw id into a typed handle. Every id handed out here
// was created with a SignalCell<T> of the same T.
struct SignalFactory {
  template <typename Handle> static Handle wrap(Id id) { return Handle{id}; }

  template <typename T> static Id allocate(T value, bool scoped) {
    auto &rt = Runtime::current();
    const auto id = Id::next();
    rt.insert_signal(std::make_shared<SignalCell<T>>(id, std::move(value)));
    if (scoped) {
      rt.set_scope(id);
    }
    return id;
  }
};

template <typename T>
std::shared_ptr<SignalCell<T>> find_cell(const Runtime &rt, Id id) {
  return std::static_pointer_cast<SignalCell<T>>(rt.signal(id));
}

} // namespace detail

template <typename Derived, typename T> class SignalReadOps {
public:
  T get() const {
    return with([](const T &v) { return v; });
  }

  T get_untracked() const {
    return with_untracked([](const T &v) { return v; });
  }

  std::optional<T> try_get() const {
    return try_with([](const T *v) -> std::optional<T> {
      if (!v) {
        return std::nullopt;
      }
      return *v;
    });
  }

  std::optional<T> try_get_untracked() const {
    return try_with_untracked([](const T *v) -> std::optional<T> {
      if (!v) {
        return std::nullopt;
      }
      return *v;
    });
  }

  template <typename F> auto with(F &&f) const {
    return with_impl(std::forward<F>(f), true);
  }

  template <typename F> auto with_untracked(F &&f) const {
    return with_impl(std::forward<F>(f), false);
  }

  // f receives nullptr once the signal is disposed.
  template <typename F> auto try_with(F &&f) const {
    return try_with_impl(std::forward<F>(f), true);
  }

  template <typename F> auto try_with_untracked(F &&f) const {
    return try_with_impl(std::forward<F>(f), false);
  }

  void track() const {
    auto &rt = Runtime::current();
    if (auto cell = rt.signal(self().id())) {
      rt.subscribe(*cell);
    }
  }

  bool is_disposed() const { return !self().id().has_signal(); }

private:
  const Derived &self() const { return static_cast<const Derived &>(*this); }

  template <typename F> auto with_impl(F &&f, bool tracked) const {
    auto &rt = Runtime::current();
    const auto id = self().id();
    auto cell = detail::find_cell<T>(rt, id);
    if (!cell) {
      throw SignalDisposed{id};
    }
    if (tracked) {
      rt.subscribe(*cell);
    }
    return cell->with(std::forward<F>(f));
  }

  template <typename F> auto try_with_impl(F &&f, bool tracked) const {
    auto &rt = Runtime::current();
    auto cell = detail::find_cell<T>(rt, self().id());
    if (!cell) {
      return std::forward<F>(f)(static_cast<const T *>(nullptr));
    }
    if (tracked) {
      rt.subscribe(*cell);
    }
    return cell->with([&](const T &v) { return f(&v); });
  }
};

// Writes on a disposed signal are no-ops; try_* report whether they landed.
template <typename Derived, typename T> class SignalWriteOps {
public:
  void set(T value) const { try_set(std::move(value)); }

  template <typename F> void update(F &&f) const {
    try_update(std::forward<F>(f));
  }

  bool try_set(T value) const {
    return try_update([&](T &v) { v = std::move(value); });
  }

  // Mutates in place, then re-runs every subscriber before returning.
  template <typename F> bool try_update(F &&f) const {
    auto &rt = Runtime::current();
    auto cell = detail::find_cell<T>(rt, self().id());
    if (!cell) {
      return false;
    }
    cell->update(std::forward<F>(f));
    rt.run_subscribers(*cell);
    return true;
  }

private:
  const Derived &self() const { return static_cast<const Derived &>(*this); }
};

template <typename T>
class ReadSignal : public SignalReadOps<ReadSignal<T>, T> {
public:
  Id id() const noexcept { return id_; }

  friend bool operator==(const ReadSignal &a, const ReadSignal &b) noexcept {
    return a.id_ == b.id_;
  }

private:
  friend struct detail::SignalFactory;
  explicit ReadSignal(Id id) : id_{id} {}

  Id id_;
};

template <typename T>
class WriteSignal : public SignalWriteOps<WriteSignal<T>, T> {
public:
  Id id() const noexcept { return id_; }

  friend bool operator==(const WriteSignal &a, const WriteSignal &b) noexcept {
    return a.id_ == b.id_;
  }

private:
  friend struct detail::SignalFactory;
  explicit WriteSignal(Id id) : id_{id} {}

  Id id_;
};

template <typename T>
class RwSignal : public SignalReadOps<RwSignal<T>, T>,
                 public SignalWriteOps<RwSignal<T>, T> {
public:
  // Allocates a signal owned by the current scope.
  static RwSignal create(T value) {
    return RwSignal{detail::SignalFactory::allocate<T>(std::move(value), true)};
  }

  Id id() const noexcept { return id_; }

  ReadSignal<T> read_only() const {
    return detail::SignalFactory::wrap<ReadSignal<T>>(id_);
  }

  WriteSignal<T> write_only() const {
    return detail::SignalFactory::wrap<WriteSignal<T>>(id_);
  }

  std::pair<ReadSignal<T>, WriteSignal<T>> split() const {
    return {read_only(), write_only()};
  }

  void dispose() const { Runtime::current().dispose(id_); }

  friend bool operator==(const RwSignal &a, const RwSignal &b) noexcept {
    return a.id_ == b.id_;
  }

private:
  friend struct detail::SignalFactory;
  explicit RwSignal(Id id) : id_{id} {}

  Id id_;
};

template <typename T> RwSignal<T> create_rw_signal(T value) {
  return RwSignal<T>::create(std::move(value));
}

template <typename T>
std::pair<ReadSignal<T>, WriteSignal<T>> create_signal(T value) {
  return RwSignal<T>::create(std::move(value)).split();
}

} // namespace floem::reactive
