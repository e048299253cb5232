#pragma once

#include <cstddef>
#include <cassert>
#include <utility>

constexpr bool log_info = false;

namespace PQueueInternal {

// Lower value wins.
using priority_t = int;

template<typename A, typename B, typename C>
decltype(std::declval<B>()()) bracket(const A& a, const B& b, const C& c) {
  a();
  struct Guard {
    const C& c;
    ~Guard() {
      c();
    }
  } g{c};
  return b();
}

template<typename T>
T non_null(T&& x) {
  assert(x);
  return std::forward<T>(x);
}

} // end of namespace PQueueInternal
