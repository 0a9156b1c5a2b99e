#include "frameguard/worker_pool.h"

#include <exception>
#include <iostream>

namespace frameguard {

WorkerPool::WorkerPool(size_t workers, size_t queue_capacity) : queue_(queue_capacity) {
    if (workers == 0) workers = 1;
    threads_.reserve(workers);
    for (size_t i = 0; i < workers; i++) threads_.emplace_back([this] { worker_loop(); });
    // with a zero backlog, a submit before the workers reach pop() would be refused
    queue_.wait_for_consumers(workers);
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::try_submit(Task task) {
    if (stopped_.load()) return false;
    return queue_.try_push(task);
}

void WorkerPool::shutdown() {
    if (stopped_.exchange(true)) return;
    queue_.shutdown();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::worker_loop() {
    Task task;
    while (queue_.pop(task)) {
        busy_.fetch_add(1);
        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[pool] task failed: " << e.what() << "\n";
        }
        task = nullptr;
        busy_.fetch_sub(1);
    }
}

} // namespace frameguard
