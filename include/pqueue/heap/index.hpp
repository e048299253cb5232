#pragma once

#include <cstddef>

namespace PQueueInternal {

// Slots are counted from 1. Slot 0 of the backing storage is a sentinel that never holds live data,
//   so the parent and children are plain shifts.

inline bool heap_is_root(size_t i) {
  return i == 1;
}

inline size_t heap_parent(size_t i) {
  return i >> 1;
}

inline size_t heap_left_child(size_t i) {
  return i << 1;
}

inline size_t heap_right_child(size_t i) {
  return heap_left_child(i) + 1;
}

// the last slot that can have a child when [count] slots are live.
inline size_t heap_last_parent(size_t count) {
  return count >> 1;
}

} // end of namespace PQueueInternal
