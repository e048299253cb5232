#pragma once

#include <cstddef>
#include <memory>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "common.hpp"
#include "config.hpp"
#include "error.hpp"
#include "safety.hpp"
#include "job.hpp"
#include "heap/index.hpp"
#include "heap/node_list.hpp"

namespace PQueueInternal {

template<typename T, typename = void>
struct is_equality_comparable : std::false_type { };

template<typename T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>> : std::true_type { };

// An entry of the queue.
// [index] is the slot the node occupied when it was handed out,
//   so a copy held by the caller doubles as a handle (see PriorityQueue::contains).
template<typename T>
struct QueueNode {
  T value;
  priority_t priority = 0;
  size_t index = 0;

  QueueNode() = default;
  explicit QueueNode(const T& value) : value(value) { }
  explicit QueueNode(T&& value) : value(std::move(value)) { }
  QueueNode(const T& value, priority_t priority, size_t index) : value(value), priority(priority), index(index) { }
  QueueNode(T&& value, priority_t priority, size_t index) : value(std::move(value)), priority(priority), index(index) { }

  operator const T&() const {
    return value;
  }

  bool operator==(const QueueNode<T>& rhs) const {
    return index == rhs.index && priority == rhs.priority && value == rhs.value;
  }

  bool operator!=(const QueueNode<T>& rhs) const {
    return !(*this == rhs);
  }
};

template<typename T>
std::ostream& operator<<(std::ostream& os, const QueueNode<T>& n) {
  return os << "Node [" << n.value << ", " << n.priority << ", " << n.index << "]";
}

// Ties return false.
template<typename T>
bool has_higher_priority(const QueueNode<T>& higher, const QueueNode<T>& lower) {
  return higher.priority < lower.priority;
}

// Ties return true.
template<typename T>
bool has_higher_or_equal_priority(const QueueNode<T>& higher, const QueueNode<T>& lower) {
  return higher.priority <= lower.priority;
}

// A binary min-heap that records in every node the slot it sits in,
//   allowing removal and priority update of arbitrary nodes in O(log n).
// Slots are 1-based; slot 0 of the storage is a sentinel.
// Every write of a node into slot i goes through place(), which sets node.index = i.
template<const PQueueConfig& cfg, typename T, typename Alloc = std::allocator<QueueNode<T>>>
struct PriorityQueue {
  static_assert(std::is_default_constructible<T>::value, "the sentinel slot needs a default constructible value");
  static_assert(is_equality_comparable<T>::value, "values are matched with ==");

public:
  using Node = QueueNode<T>;
  using Storage = NodeList<Node, cfg, Alloc>;

private:
  Storage nodes_;
  mutable AccessSentinel sentinel;

public:
  explicit PriorityQueue(ptrdiff_t initial_capacity, const Alloc& alloc = Alloc()) :
    nodes_(storage_capacity(initial_capacity), alloc) {
    nodes_.emplace_back();
  }

  PriorityQueue(PriorityQueue&&) = default;
  PriorityQueue& operator=(PriorityQueue&&) = default;

  // false once disposed or moved from.
  bool is_created() const {
    return !nodes_.released();
  }

  size_t length() const {
    return read([&]() { return length_unsafe(); });
  }

  bool empty() const {
    return length() == 0;
  }

  // live nodes that fit without reallocating.
  size_t capacity() const {
    return read([&]() { return capacity_unsafe(); });
  }

  void set_capacity(ptrdiff_t capacity) {
    write([&]() {
      if (capacity < 0 || static_cast<size_t>(capacity) < length_unsafe()) {
        throw InvalidArgument("capacity " + std::to_string(capacity) + " cannot hold " +
                              std::to_string(length_unsafe()) + " nodes");
      }
      nodes_.set_capacity(static_cast<size_t>(capacity) + 1);
    });
  }

  void ensure_capacity(ptrdiff_t capacity) {
    write([&]() {
      nodes_.ensure_capacity(storage_capacity(capacity));
    });
  }

  const Alloc& get_allocator() const {
    return nodes_.get_allocator();
  }

  bool contains(const Node& node) const {
    return read([&]() { return contains_unsafe(node); });
  }

  // the node at [position], 1-based.
  const Node& operator[](size_t position) const {
    require_created();
    assert(position >= 1 && position <= length_unsafe());
    return nodes_[position];
  }

  // the live nodes, in slot order.
  std::vector<Node> nodes() const {
    return read([&]() {
      std::vector<Node> ret;
      ret.reserve(length_unsafe());
      for (size_t i = 1; i <= length_unsafe(); ++i) {
        ret.push_back(nodes_[i]);
      }
      return ret;
    });
  }

  void enqueue(const T& value, priority_t priority) {
    enqueue_node(Node(value, priority, 0));
  }

  void enqueue(T&& value, priority_t priority) {
    enqueue_node(Node(std::move(value), priority, 0));
  }

  const Node& peek() const {
    return read([&]() -> const Node& {
      if (length_unsafe() == 0) {
        throw EmptyQueue("peek on an empty queue");
      }
      return nodes_[1];
    });
  }

  Node dequeue() {
    return write([&]() {
      if (length_unsafe() == 0) {
        throw EmptyQueue("dequeue on an empty queue");
      }
      // with a single node, removing it is all there is to do.
      Node ret = remove_swap_back_unsafe(1);
      if (length_unsafe() > 0) {
        cascade_down(1);
      }
      invariant();
      return ret;
    });
  }

  Node remove_at(size_t position) {
    return write([&]() {
      if (position < 1 || position > length_unsafe()) {
        throw std::out_of_range("position " + std::to_string(position) + " is not a live slot");
      }
      Node ret = remove_at_unsafe(position);
      invariant();
      return ret;
    });
  }

  // remove the node [node] refers to, if it is still where the handle says.
  bool remove(const Node& node) {
    return write([&]() {
      if (!contains_unsafe(node)) {
        return false;
      }
      remove_at_unsafe(node.index);
      invariant();
      return true;
    });
  }

  // remove every node satisfying [f], returning how many went.
  template<typename F>
  size_t remove_if(const F& f) {
    return write([&]() {
      size_t removed = remove_if_unsafe(f);
      invariant();
      return removed;
    });
  }

  size_t remove_by_value(const T& value) {
    return remove_if([&](const Node& n) { return n.value == value; });
  }

  size_t remove_by_priority(priority_t priority) {
    return remove_if([&](const Node& n) { return n.priority == priority; });
  }

  // set the priority of every node holding [value], returning how many changed.
  size_t update_priority_by_value(const T& value, priority_t priority) {
    return write([&]() {
      // [value] may refer into the queue, so every comparison is done before anything changes.
      std::vector<size_t> matches = matching_slots([&](const Node& n) { return n.value == value; });
      for (size_t i : matches) {
        nodes_[i].priority = priority;
      }
      // re-sifting one match may carry another one past the scan, so several matches rebuild the heap.
      if (matches.size() == 1) {
        rebalance(matches[0]);
      } else if (matches.size() > 1) {
        heapify_unsafe();
      }
      invariant();
      return matches.size();
    });
  }

  bool update_priority(const Node& node, priority_t priority) {
    return write([&]() {
      if (!contains_unsafe(node)) {
        return false;
      }
      nodes_[node.index].priority = priority;
      rebalance(node.index);
      invariant();
      return true;
    });
  }

  void clear() {
    write([&]() {
      nodes_.truncate(1);
    });
  }

  void dispose() {
    write([&]() {
      if (log_info) {
        std::cout << "dispose queue of " << length_unsafe() << " nodes" << std::endl;
      }
      nodes_.release();
    });
  }

  // the queue is disposed at once; its storage is released by a job running after [deps].
  JobHandle dispose(JobScheduler& scheduler, const JobHandle& deps = JobHandle()) {
    return write([&]() {
      auto storage = std::make_shared<Storage>(std::move(nodes_));
      return scheduler.schedule([storage]() { storage->release(); }, deps);
    });
  }

  void invariant() const {
#ifdef PQUEUE_VERIFY_INVARIANT
    assert(!nodes_.released());
    assert(nodes_.size() >= 1);
    for (size_t i = 1; i <= length_unsafe(); ++i) {
      assert(nodes_[i].index == i);
      if (!heap_is_root(i)) {
        assert(has_higher_or_equal_priority(nodes_[heap_parent(i)], nodes_[i]));
      }
    }
#endif
  }

private:
  static size_t storage_capacity(ptrdiff_t capacity) {
    if (capacity < 0) {
      throw InvalidArgument("capacity must be >= 0, got " + std::to_string(capacity));
    }
    // plus the sentinel.
    return static_cast<size_t>(capacity) + 1;
  }

  void require_created() const {
    if (nodes_.released()) {
      throw UseAfterDispose("priority queue used after its storage was released");
    }
  }

  template<typename F>
  decltype(std::declval<F>()()) read(const F& f) const {
    require_created();
    return sentinel.read(f);
  }

  template<typename F>
  decltype(std::declval<F>()()) write(const F& f) {
    require_created();
    return sentinel.write(f);
  }

  size_t length_unsafe() const {
    return nodes_.size() - 1;
  }

  size_t capacity_unsafe() const {
    return nodes_.capacity() - 1;
  }

  bool contains_unsafe(const Node& node) const {
    return node.index >= 1 && node.index <= length_unsafe() && nodes_[node.index] == node;
  }

  void place(size_t idx, Node&& node) {
    node.index = idx;
    nodes_[idx] = std::move(node);
  }

  void enqueue_node(Node&& node) {
    write([&]() {
      node.index = length_unsafe() + 1;
      nodes_.push_back(std::move(node));
      cascade_up(length_unsafe());
      invariant();
    });
  }

  // aka heapify-up. returns the slot the node ends in.
  size_t cascade_up(size_t idx) {
    assert(idx >= 1 && idx <= length_unsafe());
    if (heap_is_root(idx) || has_higher_or_equal_priority(nodes_[heap_parent(idx)], nodes_[idx])) {
      return idx;
    }
    Node node = std::move(nodes_[idx]);
    while (!heap_is_root(idx)) {
      size_t parent = heap_parent(idx);
      if (has_higher_or_equal_priority(nodes_[parent], node)) {
        break;
      }
      // node has lower priority value, so move parent down the heap to make room.
      place(idx, std::move(nodes_[parent]));
      idx = parent;
    }
    place(idx, std::move(node));
    return idx;
  }

  // aka heapify-down. returns the slot the node ends in.
  size_t cascade_down(size_t idx) {
    size_t count = length_unsafe();
    assert(idx >= 1 && idx <= count);
    Node node = std::move(nodes_[idx]);
    while (true) {
      size_t left = heap_left_child(idx);
      if (left > count) {
        break;
      }
      size_t right = heap_right_child(idx);
      // the right child wins ties against the left.
      size_t child = (right <= count && !has_higher_priority(nodes_[left], nodes_[right])) ? right : left;
      if (!has_higher_priority(nodes_[child], node)) {
        break;
      }
      place(idx, std::move(nodes_[child]));
      idx = child;
    }
    place(idx, std::move(node));
    return idx;
  }

  // bubble the node at [idx] up or down as appropriate.
  // cascade_down also covers the root, which has no parent to compare against.
  size_t rebalance(size_t idx) {
    if (!heap_is_root(idx) && has_higher_priority(nodes_[idx], nodes_[heap_parent(idx)])) {
      return cascade_up(idx);
    } else {
      return cascade_down(idx);
    }
  }

  // move the last node into [idx] and shrink by one. the caller restores the heap property at [idx].
  Node remove_swap_back_unsafe(size_t idx) {
    size_t last = length_unsafe();
    assert(idx >= 1 && idx <= last);
    Node ret = std::move(nodes_[idx]);
    if (idx != last) {
      place(idx, std::move(nodes_[last]));
    }
    nodes_.pop_back();
    return ret;
  }

  Node remove_at_unsafe(size_t idx) {
    Node ret = remove_swap_back_unsafe(idx);
    if (idx <= length_unsafe()) {
      rebalance(idx);
    }
    return ret;
  }

  // the slots whose node satisfies [f], ascending. nothing is modified,
  //   so if [f] throws the queue is as it was.
  template<typename F>
  std::vector<size_t> matching_slots(const F& f) const {
    std::vector<size_t> ret;
    for (size_t i = 1; i <= length_unsafe(); ++i) {
      if (f(static_cast<const Node&>(nodes_[i]))) {
        ret.push_back(i);
      }
    }
    return ret;
  }

  template<typename F>
  size_t remove_if_unsafe(const F& f) {
    std::vector<size_t> matches = matching_slots(f);
    // freed from the back, so the node swapped into a freed slot is never a match itself.
    for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
      remove_swap_back_unsafe(*it);
    }
    if (!matches.empty()) {
      heapify_unsafe();
    }
    return matches.size();
  }

  void heapify_unsafe() {
    for (size_t i = heap_last_parent(length_unsafe()); i >= 1; --i) {
      cascade_down(i);
    }
  }
};

} // end of namespace PQueueInternal
