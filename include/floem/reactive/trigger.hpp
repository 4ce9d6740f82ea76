#pragma once

#include <floem/reactive/signal.hpp>

#include <variant>

namespace floem::reactive {

class Trigger {
public:
  static Trigger create() {
    return Trigger{RwSignal<std::monostate>::create(std::monostate{})};
  }

  void notify() const { signal_.set(std::monostate{}); }

  void track() const { signal_.track(); }

  Id id() const noexcept { return signal_.id(); }

private:
  explicit Trigger(RwSignal<std::monostate> signal) : signal_{signal} {}

  RwSignal<std::monostate> signal_;
};

inline Trigger create_trigger() { return Trigger::create(); }

} // namespace floem::reactive
