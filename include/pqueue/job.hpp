#pragma once

#include <cstddef>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <utility>
#include <vector>
#include <iostream>

#include "common.hpp"
#include "error.hpp"

namespace PQueueInternal {

// Completion signal of a scheduled job.
// A default constructed handle refers to no job and counts as completed,
//   so it can be passed wherever "no dependency" is meant.
struct JobHandle {
  struct State {
    std::mutex mu;
    std::condition_variable finished;
    bool done = false;
    std::exception_ptr error;
  };

  std::shared_ptr<State> state;

  JobHandle() { }
  explicit JobHandle(const std::shared_ptr<State>& state) : state(state) { }

  bool is_completed() const {
    if (!state) {
      return true;
    }
    std::lock_guard<std::mutex> lock(state->mu);
    return state->done;
  }

  // block until the job has run. does not report failure.
  void wait() const {
    if (state) {
      std::unique_lock<std::mutex> lock(state->mu);
      state->finished.wait(lock, [&]() { return state->done; });
    }
  }

  // block until the job has run, rethrowing whatever the job threw.
  void complete() const {
    wait();
    if (state && state->error) {
      std::rethrow_exception(state->error);
    }
  }
};

// A fixed set of worker threads consuming jobs in FIFO order.
// A job runs only after its dependency completed; if the dependency failed,
//   the job is skipped and its handle carries the dependency's error.
struct JobScheduler {
private:
  struct Work {
    std::function<void()> f;
    JobHandle deps;
    std::shared_ptr<JobHandle::State> state;
  };

  std::vector<std::thread> threads;
  std::deque<Work> queue;
  std::mutex mu;
  std::condition_variable not_empty;
  bool stopping = false;

public:
  explicit JobScheduler(size_t num_threads) {
    if (num_threads == 0) {
      throw InvalidArgument("job scheduler needs at least one thread");
    }
    threads.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
      threads.emplace_back([this]() { worker(); });
    }
  }

  JobScheduler(const JobScheduler&) = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  // pending jobs still run before the workers are joined.
  ~JobScheduler() {
    {
      std::lock_guard<std::mutex> lock(mu);
      stopping = true;
    }
    not_empty.notify_all();
    for (std::thread& t : threads) {
      t.join();
    }
  }

  size_t thread_count() const {
    return threads.size();
  }

  JobHandle schedule(std::function<void()> f, const JobHandle& deps = JobHandle()) {
    auto state = std::make_shared<JobHandle::State>();
    {
      std::lock_guard<std::mutex> lock(mu);
      assert(!stopping);
      queue.push_back(Work { std::move(f), deps, state });
      if (log_info) {
        std::cout << "scheduled job, " << queue.size() << " pending" << std::endl;
      }
    }
    not_empty.notify_one();
    return JobHandle(state);
  }

private:
  void worker() {
    while (true) {
      Work w;
      {
        std::unique_lock<std::mutex> lock(mu);
        // stop only once the queue is drained.
        not_empty.wait(lock, [&]() { return stopping || !queue.empty(); });
        if (queue.empty()) {
          return;
        }
        w = std::move(queue.front());
        queue.pop_front();
      }
      run(w);
    }
  }

  static void run(Work& w) {
    std::exception_ptr error;
    w.deps.wait();
    if (w.deps.state && w.deps.state->error) {
      error = w.deps.state->error;
    } else {
      try {
        w.f();
      } catch (...) {
        error = std::current_exception();
      }
    }
    // drop the closure before signalling, so whatever it owned is gone once complete() returns.
    w.f = nullptr;
    {
      std::lock_guard<std::mutex> lock(w.state->mu);
      w.state->done = true;
      w.state->error = error;
    }
    w.state->finished.notify_all();
  }
};

// A queue handed to a job by ownership transfer.
// Nothing but the job can touch the queue until complete() hands it back.
template<typename Queue>
struct QueueJob {
  std::shared_ptr<Queue> queue;
  JobHandle handle;

  bool is_completed() const {
    return handle.is_completed();
  }

  // wait for the job and take the queue back. rethrows if the job failed,
  //   in which case the queue stays here and is released with the QueueJob.
  Queue complete() {
    handle.complete();
    assert(queue);
    Queue ret = std::move(*queue);
    queue.reset();
    return ret;
  }
};

template<typename Queue, typename F>
QueueJob<Queue> schedule(JobScheduler& scheduler, Queue queue, F f, const JobHandle& deps = JobHandle()) {
  auto owned = std::make_shared<Queue>(std::move(queue));
  JobHandle handle = scheduler.schedule([owned, f]() mutable { f(*owned); }, deps);
  return QueueJob<Queue> { owned, handle };
}

} // end of namespace PQueueInternal
