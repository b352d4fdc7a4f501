// Copyright (c) 2025 Bryan Kressler
//
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cassert>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace kressler::sorted_containers {

/**
 * Runtime aliasing discipline for a container.
 *
 * A container is either free, shared-borrowed by one or more read-only
 * cursors (set-algebra sequences), or exclusively borrowed by a single
 * mutating cursor (entries, drains). Borrows are represented by move-only
 * guard objects; destroying the guard is the only way a borrow ends.
 *
 * Containers call check_readable() before every read and check_writable()
 * before every mutation. Violations throw std::runtime_error.
 *
 * Not thread-safe: like the container itself, concurrent use must be
 * externally synchronized.
 */
class borrow_flag {
 public:
  class exclusive_guard;
  class shared_guard;

  borrow_flag() = default;

  // Borrows belong to one container object and are never copied with it
  borrow_flag(const borrow_flag&) : state_(0) {}
  borrow_flag& operator=(const borrow_flag&) { return *this; }

  bool is_free() const { return state_ == 0; }
  bool is_exclusive() const { return state_ == kExclusive; }
  bool is_shared() const { return state_ > 0; }

  void check_readable(const char* operation) const {
    if (is_exclusive()) {
      throw std::runtime_error(std::string("Cannot ") + operation +
                               ": container is exclusively borrowed");
    }
  }

  void check_writable(const char* operation) const {
    if (is_exclusive()) {
      throw std::runtime_error(std::string("Cannot ") + operation +
                               ": container is exclusively borrowed");
    }
    if (is_shared()) {
      throw std::runtime_error(std::string("Cannot ") + operation +
                               ": container is borrowed by a sequence");
    }
  }

  /**
   * Take the exclusive borrow.
   *
   * @param operation Name used in the error message
   * @throws std::runtime_error if any borrow is held
   */
  exclusive_guard borrow_exclusive(const char* operation);

  /**
   * Take a shared borrow. Any number may be held at once.
   *
   * @param operation Name used in the error message
   * @throws std::runtime_error if the exclusive borrow is held
   */
  shared_guard borrow_shared(const char* operation) const;

  class exclusive_guard {
   public:
    exclusive_guard() = default;
    exclusive_guard(const exclusive_guard&) = delete;
    exclusive_guard& operator=(const exclusive_guard&) = delete;

    exclusive_guard(exclusive_guard&& other) noexcept
        : flag_(std::exchange(other.flag_, nullptr)) {}

    exclusive_guard& operator=(exclusive_guard&& other) noexcept {
      if (this != &other) {
        release();
        flag_ = std::exchange(other.flag_, nullptr);
      }
      return *this;
    }

    ~exclusive_guard() { release(); }

    bool active() const { return flag_ != nullptr; }

    void release() noexcept {
      if (flag_ != nullptr) {
        assert(flag_->is_exclusive());
        flag_->state_ = 0;
        flag_ = nullptr;
      }
    }

   private:
    explicit exclusive_guard(borrow_flag* flag) : flag_(flag) {}

    borrow_flag* flag_ = nullptr;

    friend class borrow_flag;
  };

  class shared_guard {
   public:
    shared_guard() = default;
    shared_guard(const shared_guard&) = delete;
    shared_guard& operator=(const shared_guard&) = delete;

    shared_guard(shared_guard&& other) noexcept
        : flag_(std::exchange(other.flag_, nullptr)) {}

    shared_guard& operator=(shared_guard&& other) noexcept {
      if (this != &other) {
        release();
        flag_ = std::exchange(other.flag_, nullptr);
      }
      return *this;
    }

    ~shared_guard() { release(); }

    bool active() const { return flag_ != nullptr; }

    void release() noexcept {
      if (flag_ != nullptr) {
        assert(flag_->is_shared());
        --flag_->state_;
        flag_ = nullptr;
      }
    }

   private:
    explicit shared_guard(const borrow_flag* flag) : flag_(flag) {}

    const borrow_flag* flag_ = nullptr;

    friend class borrow_flag;
  };

 private:
  static constexpr std::ptrdiff_t kExclusive = -1;

  // 0 = free, > 0 = number of shared borrows, kExclusive = exclusive borrow
  mutable std::ptrdiff_t state_ = 0;
};

inline borrow_flag::exclusive_guard borrow_flag::borrow_exclusive(
    const char* operation) {
  check_writable(operation);
  state_ = kExclusive;
  return exclusive_guard(this);
}

inline borrow_flag::shared_guard borrow_flag::borrow_shared(
    const char* operation) const {
  check_readable(operation);
  ++state_;
  return shared_guard(this);
}

}  // namespace kressler::sorted_containers
