#pragma once
#include "bounded_queue.h"

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

namespace frameguard {

// Fixed set of worker threads draining a BoundedQueue. A task runs on exactly
// one worker from start to finish.
class WorkerPool {
public:
    using Task = std::function<void()>;

    // queue_capacity counts waiting tasks only, not the ones being run; an
    // idle worker always takes a task, so 0 means "no backlog".
    WorkerPool(size_t workers, size_t queue_capacity);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // false when the queue is full or the pool is stopping.
    bool try_submit(Task task);

    // Stops accepting work, finishes queued tasks, joins the workers.
    void shutdown();

    size_t workers() const { return threads_.size(); }
    size_t queued() const { return queue_.size(); }
    size_t idle() const { return queue_.waiting(); }
    size_t busy() const { return busy_.load(); }

private:
    void worker_loop();

    BoundedQueue<Task> queue_;
    std::vector<std::thread> threads_;
    std::atomic<size_t> busy_{0};
    std::atomic<bool> stopped_{false};
};

} // namespace frameguard
