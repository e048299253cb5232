#pragma once

#ifdef PQUEUE_CHECK_ACCESS
#include <atomic>
#endif

#include "common.hpp"
#include "error.hpp"

namespace PQueueInternal {

// Guards a container against a reader and a writer, or two writers, being active at once.
// Any number of readers may overlap.
// With PQUEUE_CHECK_ACCESS undefined every scope is a direct call.
struct AccessSentinel {
#ifdef PQUEUE_CHECK_ACCESS
  // -1 while a writer is active, otherwise the number of active readers.
  std::atomic<int> active { 0 };

  AccessSentinel() { }

  // a container is only moved while nothing is using it, so the fresh sentinel starts idle.
  AccessSentinel(AccessSentinel&& other) {
    assert(other.idle());
    static_cast<void>(other);
  }

  AccessSentinel& operator=(AccessSentinel&& other) {
    assert(idle() && other.idle());
    static_cast<void>(other);
    return *this;
  }

  void acquire_read() {
    int cur = active.load();
    do {
      if (cur < 0) {
        throw AccessViolation("read while a writer is active");
      }
    } while (!active.compare_exchange_weak(cur, cur + 1));
  }

  void release_read() {
    int prev = active.fetch_sub(1);
    assert(prev > 0);
    static_cast<void>(prev);
  }

  void acquire_write() {
    int expected = 0;
    if (!active.compare_exchange_strong(expected, -1)) {
      throw AccessViolation(expected < 0 ? "write while another writer is active" : "write while a reader is active");
    }
  }

  void release_write() {
    int prev = active.exchange(0);
    assert(prev == -1);
    static_cast<void>(prev);
  }

  template<typename F>
  decltype(std::declval<F>()()) read(const F& f) {
    return bracket([&]() { acquire_read(); }, f, [&]() { release_read(); });
  }

  template<typename F>
  decltype(std::declval<F>()()) write(const F& f) {
    return bracket([&]() { acquire_write(); }, f, [&]() { release_write(); });
  }

  bool idle() const {
    return active.load() == 0;
  }
#else
  template<typename F>
  decltype(std::declval<F>()()) read(const F& f) {
    return f();
  }

  template<typename F>
  decltype(std::declval<F>()()) write(const F& f) {
    return f();
  }

  bool idle() const {
    return true;
  }
#endif
};

} // end of namespace PQueueInternal
