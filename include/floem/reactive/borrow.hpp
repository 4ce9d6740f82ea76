#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace floem::reactive {

class BorrowError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

// Single-threaded shared/exclusive access counter. Conflicting access throws
// instead of aliasing mutable state.
class BorrowFlag {
public:
  void acquire_shared(const char *what) const {
    if (state_ < 0) {
      throw BorrowError{std::string{what} + " already mutably borrowed"};
    }
    ++state_;
  }

  void release_shared() const noexcept { --state_; }

  void acquire_mut(const char *what) const {
    if (state_ != 0) {
      throw BorrowError{std::string{what} + " already borrowed"};
    }
    state_ = -1;
  }

  void release_mut() const noexcept { state_ = 0; }

  bool borrowed() const noexcept { return state_ != 0; }

  bool borrowed_mut() const noexcept { return state_ < 0; }

private:
  mutable std::int32_t state_{0};
};

class SharedBorrow {
public:
  SharedBorrow(const BorrowFlag &flag, const char *what) : flag_{&flag} {
    flag_->acquire_shared(what);
  }
  SharedBorrow(const SharedBorrow &) = delete;
  SharedBorrow &operator=(const SharedBorrow &) = delete;
  ~SharedBorrow() { flag_->release_shared(); }

private:
  const BorrowFlag *flag_;
};

class MutBorrow {
public:
  MutBorrow(const BorrowFlag &flag, const char *what) : flag_{&flag} {
    flag_->acquire_mut(what);
  }
  MutBorrow(const MutBorrow &) = delete;
  MutBorrow &operator=(const MutBorrow &) = delete;
  ~MutBorrow() { flag_->release_mut(); }

private:
  const BorrowFlag *flag_;
};

} // namespace floem::reactive
