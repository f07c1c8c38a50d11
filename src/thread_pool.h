#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed-size worker pool for nullary jobs; jobs start in FIFO order.
// The destructor finishes every queued job before joining.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads) : stop(false) {
        size_t count = threads == 0 ? 1 : threads;
        for (size_t i = 0; i < count; ++i) {
            workers.emplace_back([this] { work(); });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            stop = true;
        }
        condition.notify_all();
        for (std::thread& worker : workers) {
            worker.join();
        }
    }

    // Exceptions thrown by the job surface from the returned future
    template<class Job>
    std::future<std::invoke_result_t<Job>> enqueue(Job&& job) {
        using Result = std::invoke_result_t<Job>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Job>(job));
        std::future<Result> result = task->get_future();
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (stop) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            jobs.emplace([task]() { (*task)(); });
        }
        condition.notify_one();
        return result;
    }

    size_t size() const { return workers.size(); }

private:
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> jobs;
    std::mutex queue_mutex;
    std::condition_variable condition;
    bool stop;

    void work() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                condition.wait(lock, [this] { return stop || !jobs.empty(); });
                if (stop && jobs.empty()) {
                    return;
                }
                job = std::move(jobs.front());
                jobs.pop();
            }
            job();
        }
    }
};
