// task_queue.cpp

#include "task_queue.hpp"
#include "logger.hpp"

#include <exception>
#include <utility>

TaskQueue::TaskQueue(const std::string& name) : name(name), running(true), active(0) {
    worker_thread = std::thread(&TaskQueue::worker_loop, this);
}

TaskQueue::~TaskQueue() {
    stop();
}

bool TaskQueue::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!running) {
            return false;
        }
        tasks.push(std::move(task));
    }
    queue_condition.notify_one();
    return true;
}

void TaskQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    idle_condition.wait(lock, [this] { return tasks.empty() && active == 0; });
}

void TaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running = false;
    }
    queue_condition.notify_all();
    if (worker_thread.joinable()) {
        worker_thread.join();
    }
}

void TaskQueue::worker_loop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock, [this] { return !tasks.empty() || !running; });
            if (tasks.empty()) {
                break;
            }
            task = std::move(tasks.front());
            tasks.pop();
            active++;
        }

        try {
            task();
        } catch (const std::exception& e) {
            log_status("ERROR: Task on " + name + " worker failed: " + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active--;
        }
        idle_condition.notify_all();
    }
}
