#include "pqueue/ffi.hpp"
#include "pqueue/pqueue.hpp"

#include <new>

struct PQueue
{
    PQueueInternal::PriorityQueue<PQueueInternal::default_config, int> q;

    explicit PQueue(int64_t initial_capacity) : q(static_cast<ptrdiff_t>(initial_capacity)) {}
};

PQueue *pqueue_new(int64_t initial_capacity)
{
    try
    {
        return new PQueue(initial_capacity);
    }
    catch (const PQueueInternal::InvalidArgument &)
    {
        return nullptr;
    }
    catch (const PQueueInternal::CapacityOverflow &)
    {
        return nullptr;
    }
    catch (const std::bad_alloc &)
    {
        return nullptr;
    }
}

void pqueue_delete(PQueue *queue)
{
    delete queue;
}

size_t pqueue_length(const PQueue *queue)
{
    return queue->q.length();
}

size_t pqueue_capacity(const PQueue *queue)
{
    return queue->q.capacity();
}

bool pqueue_set_capacity(PQueue *queue, int64_t capacity)
{
    try
    {
        queue->q.set_capacity(static_cast<ptrdiff_t>(capacity));
        return true;
    }
    catch (const PQueueInternal::InvalidArgument &)
    {
        return false;
    }
    catch (const PQueueInternal::CapacityOverflow &)
    {
        return false;
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

bool pqueue_enqueue(PQueue *queue, int value, int priority)
{
    try
    {
        queue->q.enqueue(value, priority);
        return true;
    }
    catch (const PQueueInternal::CapacityOverflow &)
    {
        return false;
    }
    catch (const std::bad_alloc &)
    {
        return false;
    }
}

bool pqueue_peek(const PQueue *queue, int *value, int *priority)
{
    if (queue->q.empty())
    {
        return false;
    }
    const auto &n = queue->q.peek();
    *value = n.value;
    *priority = n.priority;
    return true;
}

bool pqueue_dequeue(PQueue *queue, int *value, int *priority)
{
    if (queue->q.empty())
    {
        return false;
    }
    auto n = queue->q.dequeue();
    *value = n.value;
    *priority = n.priority;
    return true;
}

size_t pqueue_remove_by_value(PQueue *queue, int value)
{
    return queue->q.remove_by_value(value);
}

size_t pqueue_remove_by_priority(PQueue *queue, int priority)
{
    return queue->q.remove_by_priority(priority);
}

size_t pqueue_update_priority_by_value(PQueue *queue, int value, int priority)
{
    return queue->q.update_priority_by_value(value, priority);
}
