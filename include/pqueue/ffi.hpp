#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

// A C view of an int-valued queue using default_config.
// Failures are reported through return values; no exception crosses this boundary.
#ifdef __cplusplus
extern "C" {
#endif

typedef struct PQueue PQueue;

// NULL when [initial_capacity] is negative or cannot be allocated.
PQueue* pqueue_new(int64_t initial_capacity);
void pqueue_delete(PQueue* queue);

size_t pqueue_length(const PQueue* queue);
size_t pqueue_capacity(const PQueue* queue);
bool pqueue_set_capacity(PQueue* queue, int64_t capacity);

bool pqueue_enqueue(PQueue* queue, int value, int priority);
// false when the queue is empty, leaving [value] and [priority] untouched.
bool pqueue_peek(const PQueue* queue, int* value, int* priority);
bool pqueue_dequeue(PQueue* queue, int* value, int* priority);

size_t pqueue_remove_by_value(PQueue* queue, int value);
size_t pqueue_remove_by_priority(PQueue* queue, int priority);
size_t pqueue_update_priority_by_value(PQueue* queue, int value, int priority);

#ifdef __cplusplus
}
#endif
