#pragma once

#include <floem/reactive/runtime.hpp>

#include <optional>
#include <utility>

namespace floem::reactive {

// One value per type per runtime; a second provide replaces the first.
template <typename T> void provide_context(T value) {
  Runtime::current().provide_context<T>(std::move(value));
}

template <typename T> std::optional<T> use_context() {
  return Runtime::current().use_context<T>();
}

} // namespace floem::reactive
