#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <string>
#include <iostream>
#include <utility>
#include <type_traits>

#include "../common.hpp"
#include "../config.hpp"
#include "../error.hpp"

namespace PQueueInternal {

// A contiguous growable array with an explicit capacity.
// Unlike std::vector, the storage can be released early (release()),
//   after which every access is a bug and the owner is expected to check released().
// Growth follows cfg.growth_factor, so push_back is amortized constant time.
template<typename T, const PQueueConfig& cfg, typename Alloc = std::allocator<T>>
struct NodeList {
private:
  using traits = std::allocator_traits<Alloc>;

  Alloc alloc;
  T* data = nullptr;
  size_t size_ = 0;
  size_t capacity_ = 0;
  bool released_ = false;

public:
  explicit NodeList(size_t capacity, const Alloc& alloc = Alloc()) : alloc(alloc) {
    if (!cfg.valid()) {
      throw InvalidArgument("growth_factor must be greater than 1");
    }
    if (capacity > 0) {
      reallocate(capacity);
    }
  }

  NodeList(const NodeList&) = delete;
  NodeList& operator=(const NodeList&) = delete;

  NodeList(NodeList&& other) noexcept :
    alloc(std::move(other.alloc)),
    data(other.data),
    size_(other.size_),
    capacity_(other.capacity_),
    released_(other.released_) {
    other.data = nullptr;
    other.size_ = 0;
    other.capacity_ = 0;
    other.released_ = true;
  }

  NodeList& operator=(NodeList&& other) noexcept {
    if (this != &other) {
      free_storage();
      alloc = std::move(other.alloc);
      data = other.data;
      size_ = other.size_;
      capacity_ = other.capacity_;
      released_ = other.released_;
      other.data = nullptr;
      other.size_ = 0;
      other.capacity_ = 0;
      other.released_ = true;
    }
    return *this;
  }

  ~NodeList() {
    free_storage();
  }

  size_t size() const {
    return size_;
  }

  bool empty() const {
    return size_ == 0;
  }

  size_t capacity() const {
    return capacity_;
  }

  bool released() const {
    return released_;
  }

  const Alloc& get_allocator() const {
    return alloc;
  }

  T& operator[](size_t index) {
    assert(index < size_);
    return non_null(data)[index];
  }

  const T& operator[](size_t index) const {
    assert(index < size_);
    return non_null(data)[index];
  }

  T& back() {
    return (*this)[size_ - 1];
  }

  const T& back() const {
    return (*this)[size_ - 1];
  }

  template<typename... Args>
  T& emplace_back(Args&&... args) {
    assert(!released_);
    if (size_ == capacity_) {
      ensure_capacity(size_ + 1);
    }
    traits::construct(alloc, data + size_, std::forward<Args>(args)...);
    ++size_;
    return back();
  }

  void push_back(const T& t) {
    emplace_back(t);
  }

  void push_back(T&& t) {
    emplace_back(std::move(t));
  }

  void pop_back() {
    assert(size_ > 0);
    --size_;
    traits::destroy(alloc, data + size_);
  }

  // shrink to [new_size] elements, keeping the storage.
  void truncate(size_t new_size) {
    while (size_ > new_size) {
      pop_back();
    }
  }

  // grow so that at least [n] elements fit, following the growth policy.
  void ensure_capacity(size_t n) {
    assert(!released_);
    if (n <= capacity_) {
      return;
    }
    size_t grown = capacity_;
    if (grown <= max_size() / cfg.growth_factor.first) {
      grown = grown * cfg.growth_factor.first / cfg.growth_factor.second;
    } else {
      grown = max_size();
    }
    reallocate(std::max({n, grown, cfg.min_capacity}));
  }

  // reallocate to exactly [n] elements. [n] must not be smaller than size().
  void set_capacity(size_t n) {
    assert(!released_);
    assert(n >= size_);
    if (n != capacity_) {
      reallocate(n);
    }
  }

  size_t max_size() const {
    return traits::max_size(alloc);
  }

  void release() {
    assert(!released_);
    free_storage();
    released_ = true;
  }

private:
  void free_storage() {
    if (data != nullptr) {
      if (log_info) {
        std::cout << "node list releases " << capacity_ << " slots" << std::endl;
      }
      truncate(0);
      traits::deallocate(alloc, data, capacity_);
      data = nullptr;
      capacity_ = 0;
    }
  }

  // strong guarantee: if anything throws, the old storage is untouched.
  void reallocate(size_t n) {
    if (n > max_size()) {
      throw CapacityOverflow("node list cannot hold " + std::to_string(n) + " elements");
    }
    T* fresh = n > 0 ? traits::allocate(alloc, n) : nullptr;
    size_t moved = 0;
    try {
      for (; moved < size_; ++moved) {
        traits::construct(alloc, fresh + moved, std::move_if_noexcept(data[moved]));
      }
    } catch (...) {
      for (size_t i = 0; i < moved; ++i) {
        traits::destroy(alloc, fresh + i);
      }
      traits::deallocate(alloc, fresh, n);
      throw;
    }
    if (log_info) {
      std::cout << "node list reallocates from " << capacity_ << " to " << n << " slots" << std::endl;
    }
    for (size_t i = 0; i < size_; ++i) {
      traits::destroy(alloc, data + i);
    }
    if (data != nullptr) {
      traits::deallocate(alloc, data, capacity_);
    }
    data = fresh;
    capacity_ = n;
  }
};

} // end of namespace PQueueInternal
