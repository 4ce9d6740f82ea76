#pragma once

#include <floem/reactive/signal.hpp>

#include <utility>

namespace floem::reactive {

// Signal owned by this object rather than by a scope. Destroying it disposes
// the signal and every effect subscribed to it.
template <typename T>
class BaseSignal : public SignalReadOps<BaseSignal<T>, T>,
                   public SignalWriteOps<BaseSignal<T>, T> {
public:
  explicit BaseSignal(T value)
      : id_{detail::SignalFactory::allocate<T>(std::move(value), false)} {}

  BaseSignal(const BaseSignal &) = delete;
  BaseSignal &operator=(const BaseSignal &) = delete;

  BaseSignal(BaseSignal &&other) noexcept : id_{std::exchange(other.id_, Id{})} {}

  BaseSignal &operator=(BaseSignal &&other) {
    if (this != &other) {
      release();
      id_ = std::exchange(other.id_, Id{});
    }
    return *this;
  }

  ~BaseSignal() { release(); }

  Id id() const noexcept { return id_; }

  ReadSignal<T> read_only() const {
    return detail::SignalFactory::wrap<ReadSignal<T>>(id_);
  }

  WriteSignal<T> write_only() const {
    return detail::SignalFactory::wrap<WriteSignal<T>>(id_);
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

} // namespace floem::reactive
