#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

// One worker thread running posted tasks in FIFO order.
// post() never blocks on the work itself.
class TaskQueue {
private:
    std::string name;
    std::thread worker_thread;
    std::queue<std::function<void()>> tasks;
    std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::condition_variable idle_condition;
    bool running;
    size_t active;

    void worker_loop();

public:
    explicit TaskQueue(const std::string& name);
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // False once stop() was called
    bool post(std::function<void()> task);

    // Blocks until every posted task has finished
    void wait_idle();

    // Runs what is already queued, then joins the worker
    void stop();
};
