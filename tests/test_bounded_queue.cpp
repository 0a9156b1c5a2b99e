#include "test_common.h"

#include "frameguard/bounded_queue.h"
#include "frameguard/worker_pool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using frameguard::BoundedQueue;
using frameguard::WorkerPool;

int main() {
    BoundedQueue<std::string> q(2);

    std::string a = "first", b = "second", c = "third";
    expect_true(q.try_push(a), "push 1 should succeed");
    expect_true(q.try_push(b), "push 2 should succeed");
    expect_true(!q.try_push(c), "push 3 should be refused at capacity");
    expect_true(c == "third", "refused item left untouched");
    expect_eq_ll((long long)q.size(), 2, "size at capacity");

    std::string out;
    expect_true(q.pop(out) && out == "first", "FIFO order (1)");
    expect_true(q.pop(out) && out == "second", "FIFO order (2)");

    // Blocking pop should unblock on shutdown
    BoundedQueue<int> q2(4);
    bool popped = true;
    std::thread t([&] {
        int v = 0;
        popped = q2.pop(v);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();
    expect_true(!popped, "pop should return false after shutdown on empty queue");

    // Queued items are still drained after shutdown, new ones refused
    BoundedQueue<int> q3(4);
    int x = 7;
    expect_true(q3.try_push(x), "push before shutdown");
    q3.shutdown();
    int y = 8;
    expect_true(!q3.try_push(y), "push after shutdown refused");
    int v = 0;
    expect_true(q3.pop(v) && v == 7, "queued item drained");
    expect_true(!q3.pop(v), "then empty");
    expect_true(q3.closed(), "closed flag");

    // Zero capacity refuses everything
    BoundedQueue<int> q4(0);
    expect_true(!q4.try_push(x), "zero capacity queue refuses");

    // Worker pool: a busy pool with a full queue refuses, the rest all run
    {
        std::mutex mu;
        std::condition_variable cv;
        bool gate = false;
        std::atomic<int> ran{0};

        WorkerPool pool(1, 1);
        expect_eq_ll((long long)pool.workers(), 1, "one worker");
        auto blocker = [&] {
            std::unique_lock<std::mutex> lk(mu);
            cv.wait(lk, [&] { return gate; });
            ran.fetch_add(1);
        };
        expect_true(pool.try_submit(blocker), "first task accepted");
        while (pool.busy() == 0) std::this_thread::sleep_for(std::chrono::milliseconds(5));
        expect_true(pool.try_submit([&] { ran.fetch_add(1); }), "second task queued");
        expect_true(!pool.try_submit([&] { ran.fetch_add(1); }), "third task refused");

        {
            std::lock_guard<std::mutex> lk(mu);
            gate = true;
        }
        cv.notify_all();
        pool.shutdown();
        expect_eq_ll(ran.load(), 2, "accepted tasks ran");
        expect_true(!pool.try_submit([] {}), "stopped pool refuses");
        pool.shutdown();
    }

    // Zero backlog: idle workers still take tasks, a fully busy pool refuses
    {
        std::mutex mu;
        std::condition_variable cv;
        bool gate = false;
        std::atomic<int> ran{0};

        WorkerPool pool(4, 0);
        expect_eq_ll((long long)pool.idle(), 4, "workers idle once constructed");
        auto blocker = [&] {
            std::unique_lock<std::mutex> lk(mu);
            cv.wait(lk, [&] { return gate; });
            ran.fetch_add(1);
        };
        for (int i = 0; i < 4; i++) expect_true(pool.try_submit(blocker), "idle worker takes the task");
        expect_true(!pool.try_submit(blocker), "no idle worker and no backlog: refused");

        {
            std::lock_guard<std::mutex> lk(mu);
            gate = true;
        }
        cv.notify_all();
        pool.shutdown();
        expect_eq_ll(ran.load(), 4, "handed-off tasks ran");
    }

    // A throwing task does not take the worker down
    {
        std::atomic<int> ran{0};
        WorkerPool pool(2, 8);
        expect_true(pool.try_submit([] { throw std::runtime_error("boom"); }), "throwing task accepted");
        for (int i = 0; i < 4; i++) expect_true(pool.try_submit([&] { ran.fetch_add(1); }), "task accepted");
        pool.shutdown();
        expect_eq_ll(ran.load(), 4, "pool survives a throwing task");
    }

    std::cerr << "test_bounded_queue: ALL PASSED" << std::endl;
    return 0;
}
