#pragma once

#include <memory>

#include "common.hpp"
#include "config.hpp"
#include "error.hpp"
#include "job.hpp"
#include "priority_queue.hpp"

#define IMPORT_PQUEUE(cfg)                                                                         \
  template<typename T, typename Alloc = std::allocator<PQueueInternal::QueueNode<T>>>              \
  using PriorityQueue = PQueueInternal::PriorityQueue<cfg, T, Alloc>;                              \
  template<typename T>                                                                             \
  using QueueNode = PQueueInternal::QueueNode<T>;                                                  \
  using JobScheduler = PQueueInternal::JobScheduler;                                               \
  using JobHandle = PQueueInternal::JobHandle;                                                     \
  template<typename Queue>                                                                         \
  using QueueJob = PQueueInternal::QueueJob<Queue>;                                                \
  using PQueueInternal::schedule;                                                                  \
  using InvalidArgument = PQueueInternal::InvalidArgument;                                         \
  using EmptyQueue = PQueueInternal::EmptyQueue;                                                   \
  using UseAfterDispose = PQueueInternal::UseAfterDispose;                                         \
  using CapacityOverflow = PQueueInternal::CapacityOverflow;                                       \
  using AccessViolation = PQueueInternal::AccessViolation;                                         \
  ;
