#include "pqueue/pqueue.hpp"

#include <iostream>
#include <string>

IMPORT_PQUEUE(PQueueInternal::default_config)

int main() {
  PriorityQueue<std::string> q(4);
  q.enqueue("write report", 5);
  q.enqueue("fix build", 1);
  q.enqueue("lunch", 4);
  q.enqueue("reply to mail", 7);
  q.update_priority_by_value("reply to mail", 0);

  JobScheduler scheduler(1);
  auto job = schedule(scheduler, std::move(q), [](PriorityQueue<std::string>& q) { q.enqueue("review", 2); });
  q = job.complete();

  while (!q.empty()) {
    std::cout << q.dequeue() << std::endl;
  }
  q.dispose();
  return 0;
}
