#pragma once

#include <stdexcept>
#include <string>

namespace PQueueInternal {

// negative capacity, or a configuration the queue cannot work with.
struct InvalidArgument : std::invalid_argument {
  explicit InvalidArgument(const std::string& what) : std::invalid_argument(what) { }
};

// dequeue or peek on a queue with no live entry.
struct EmptyQueue : std::out_of_range {
  explicit EmptyQueue(const std::string& what) : std::out_of_range(what) { }
};

// any operation after the backing storage has been released.
struct UseAfterDispose : std::logic_error {
  explicit UseAfterDispose(const std::string& what) : std::logic_error(what) { }
};

// backing storage larger than the allocator can address.
struct CapacityOverflow : std::length_error {
  explicit CapacityOverflow(const std::string& what) : std::length_error(what) { }
};

// a reader and a writer, or two writers, active on the same queue at once.
// only raised when PQUEUE_CHECK_ACCESS is defined.
struct AccessViolation : std::logic_error {
  explicit AccessViolation(const std::string& what) : std::logic_error(what) { }
};

} // end of namespace PQueueInternal
