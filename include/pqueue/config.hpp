#pragma once

#include <cstddef>
#include <utility>

#include "common.hpp"

namespace PQueueInternal {

struct PQueueConfig {
  // when the backing storage is full it grows to capacity * growth_factor,
  // or to what the request needs if that is larger.
  // [growth_factor] is stored as a rational number as a/b here. it must be greater than 1.
  std::pair<unsigned int, unsigned int> growth_factor;
  // the smallest capacity (in slots, sentinel included) a growing storage will allocate.
  size_t min_capacity;
  constexpr PQueueConfig(const std::pair<unsigned int, unsigned int>& growth_factor,
                         size_t min_capacity) :
    growth_factor(growth_factor),
    min_capacity(min_capacity)
  { }

  constexpr bool valid() const {
    return growth_factor.second != 0 && growth_factor.first > growth_factor.second;
  }
};

inline constexpr PQueueConfig default_config(/*growth_factor=*/{2, 1}, /*min_capacity=*/8);

// grows by half, starting small. useful for queues that stay short.
inline constexpr PQueueConfig compact_config(/*growth_factor=*/{3, 2}, /*min_capacity=*/2);

} // end of namespace PQueueInternal
