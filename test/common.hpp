#pragma once

#include <memory>
#include <cstddef>
#include <vector>

#include <gtest/gtest.h>

#include "pqueue/pqueue.hpp"

IMPORT_PQUEUE(PQueueInternal::default_config)

template<bool is_unique>
struct Element;

template<>
struct Element<false> {
  int i = 0;

  int get() const { return i; }
  bool operator<(const Element<false> &other) const { return get() < other.get(); }
  bool operator==(const Element<false> &other) const { return get() == other.get(); }
};

template<>
struct Element<true> {
  std::unique_ptr<int> ptr;

  template<typename... Args>
  Element(Args&&... args) : ptr(std::make_unique<int>(std::forward<Args>(args)...)) {}

  int get() const { return *ptr; }
  bool operator<(const Element<true> &other) const { return get() < other.get(); }
  bool operator==(const Element<true> &other) const { return get() == other.get(); }
};

// [test_id] is used to separate different tests
template<typename test_id>
struct Resource {
  static int count;

  int value;

  Resource() : Resource(0) { }
  Resource(int value) : value(value) { ++count; }
  Resource(const Resource& r) : value(r.value) { ++count; }
  Resource& operator=(const Resource&) = default;
  ~Resource() { --count; }

  bool operator==(const Resource& rhs) const { return value == rhs.value; }
};

template<typename test_id>
int Resource<test_id>::count = 0;

// std::allocator that counts the slots it hands out and takes back.
template<typename T>
struct CountingAllocator {
  using value_type = T;

  std::shared_ptr<size_t> allocated = std::make_shared<size_t>(0);
  std::shared_ptr<size_t> deallocated = std::make_shared<size_t>(0);

  CountingAllocator() = default;
  template<typename U>
  CountingAllocator(const CountingAllocator<U>& other) : allocated(other.allocated), deallocated(other.deallocated) { }

  T* allocate(size_t n) {
    *allocated += n;
    return std::allocator<T>().allocate(n);
  }

  void deallocate(T* p, size_t n) {
    *deallocated += n;
    std::allocator<T>().deallocate(p, n);
  }

  size_t outstanding() const {
    return *allocated - *deallocated;
  }

  template<typename U>
  bool operator==(const CountingAllocator<U>& rhs) const { return allocated == rhs.allocated; }
  template<typename U>
  bool operator!=(const CountingAllocator<U>& rhs) const { return allocated != rhs.allocated; }
};

// Check both heap invariants through the public interface.
template<typename Queue>
void check_heap(const Queue& q) {
  size_t count = q.length();
  for (size_t i = 1; i <= count; ++i) {
    EXPECT_EQ(q[i].index, i) << "node " << i << " does not know its slot";
    if (i > 1) {
      EXPECT_LE(q[i / 2].priority, q[i].priority) << "node " << i << " beats its parent";
    }
  }
}

template<typename Queue>
std::vector<int> drain_priorities(Queue& q) {
  std::vector<int> ret;
  while (!q.empty()) {
    ret.push_back(q.dequeue().priority);
  }
  return ret;
}
