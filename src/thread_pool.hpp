#pragma once
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <vector>
#include <iostream>
#include <string>

// Fixed-size worker pool for blocking work kept off the event loop.
// Tasks start in FIFO order, so a pool of one thread serializes them.
// The destructor runs whatever is still queued before joining.
class ThreadPool {
public:
    explicit ThreadPool(size_t numThreads = 1, std::string name = "pool")
        : name_(std::move(name)) {
        if (numThreads == 0) numThreads = 1;
        workers_.reserve(numThreads);
        for(size_t i = 0; i < numThreads; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            closing_ = true;
        }
        cv_.notify_all();
        for(auto& w : workers_) {
            if(w.joinable()) w.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Fire-and-forget. An exception escaping the task is logged under the
    // pool's name. Returns false once the pool is closing.
    bool post(std::function<void()> task) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if(closing_) return false;
            queue_.push(std::move(task));
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until every task posted before this call has started, and on a
    // single-threaded pool until it has finished.
    void drain() {
        auto marker = std::make_shared<std::promise<void>>();
        auto reached = marker->get_future();
        if(!post([marker]{ marker->set_value(); })) return;
        reached.wait();
    }

private:
    void worker_loop() {
        for(;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mtx_);
                cv_.wait(lock, [this]{ return closing_ || !queue_.empty(); });
                if(queue_.empty()) return;
                task = std::move(queue_.front());
                queue_.pop();
            }
            try {
                task();
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "] task failed: " << e.what() << std::endl;
            }
        }
    }

    std::string name_;
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    std::mutex mtx_;
    std::condition_variable cv_;
    bool closing_ = false;
};
