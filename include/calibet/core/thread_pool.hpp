#pragma once

/** \file thread_pool.hpp
 *  \brief Fixed-size FIFO thread pool for independent numerical jobs.
 *
 * Tasks are queued centrally and executed in submission order by the first free
 * worker. Results and exceptions travel back through std::future.
 */

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace calibet::core {

class ThreadPool {
public:
    /** \brief Construct pool.
     *
     * \param num_threads Number of worker threads (0 = hardware concurrency / 2)
     */
    explicit ThreadPool(std::size_t num_threads = 0)
        : stop_(false) {
        if (num_threads == 0) {
            num_threads = std::max(1u, std::thread::hardware_concurrency() / 2);
        }
        workers_.reserve(num_threads);
        for (std::size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            stop_ = true;
        }
        cv_.notify_all();

        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /** \brief Submit task to the pool.
     *
     * \param func Callable executed on a worker
     * \return Future for the callable's result (exceptions are rethrown by get())
     */
    template<typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using return_type = std::invoke_result_t<std::decay_t<Func>>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<Func>(func));
        auto future = task->get_future();

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            tasks_.emplace_back([task] { (*task)(); });
        }

        cv_.notify_one();
        return future;
    }

private:
    auto worker_loop() -> void {
        #if defined(__linux__)
          pthread_setname_np(pthread_self(), "calibet-worker");
        #endif
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

                if (stop_ && tasks_.empty()) {
                    return;
                }

                task = std::move(tasks_.front());
                tasks_.pop_front();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_;
};

} // namespace calibet::core
