#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace floem::reactive {

namespace detail {
inline std::atomic<std::uint64_t> next_reactive_id{1};
} // namespace detail

// Identifies a signal, an effect or a scope. One counter serves all three so
// an effect id doubles as the id of the scope its body runs in.
struct Id {
  std::uint64_t raw{};

  static Id next() {
    return Id{detail::next_reactive_id.fetch_add(1, std::memory_order_relaxed)};
  }

  // True while a signal is stored under this id in the current runtime.
  bool has_signal() const;

  friend bool operator==(Id, Id) = default;
};

inline std::ostream &operator<<(std::ostream &os, Id id) {
  return os << "Id(" << id.raw << ")";
}

} // namespace floem::reactive

template <> struct std::hash<floem::reactive::Id> {
  std::size_t operator()(floem::reactive::Id id) const noexcept {
    return std::hash<std::uint64_t>{}(id.raw);
  }
};
