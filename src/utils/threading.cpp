/**
 * Canopy Threading Utilities
 *
 * Thread pool and parallel execution helpers.
 */

#include "canopy/threading.hpp"
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <exception>
#include <future>
#include <memory>
#include <type_traits>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace canopy {
namespace threading {

// ============================================================================
// Thread Pool (for non-OpenMP builds)
// ============================================================================

class ThreadPool {
public:
    explicit ThreadPool(size_t n_threads = 0) {
        if (n_threads == 0) {
            n_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }

        for (size_t i = 0; i < n_threads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;

                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        condition_.wait(lock, [this] {
                            return stop_ || !tasks_.empty();
                        });

                        if (stop_ && tasks_.empty()) {
                            return;
                        }

                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }

                    task();
                }
            });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        condition_.notify_all();

        for (auto& worker : workers_) {
            worker.join();
        }
    }

    template<typename F>
    std::future<typename std::invoke_result<F>::type> submit(F&& f) {
        using return_type = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> result = task->get_future();

        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_.emplace([task]() { (*task)(); });
        }

        condition_.notify_one();
        return result;
    }

    size_t n_threads() const {
        return workers_.size();
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

// Global thread pool
static std::unique_ptr<ThreadPool> global_pool;
static size_t pool_size = 0;
static std::mutex pool_mutex;

static ThreadPool& get_global_pool() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (!global_pool) {
        global_pool = std::make_unique<ThreadPool>(pool_size);
    }
    return *global_pool;
}

void shutdown_global_pool() {
    std::lock_guard<std::mutex> lock(pool_mutex);
    global_pool.reset();
}

// ============================================================================
// Parallel For
// ============================================================================

void parallel_for(size_t begin, size_t end, const std::function<void(size_t)>& body,
                  int n_threads) {
    if (begin >= end) return;

    if (n_threads == 1 || end - begin == 1) {
        for (size_t i = begin; i < end; ++i) {
            body(i);
        }
        return;
    }

    std::exception_ptr first_error;
    std::mutex error_mutex;

    #ifdef _OPENMP
    const int threads = n_threads > 0 ? n_threads : omp_get_max_threads();
    const long long first = static_cast<long long>(begin);
    const long long last = static_cast<long long>(end);

    #pragma omp parallel for schedule(dynamic) num_threads(threads)
    for (long long i = first; i < last; ++i) {
        try {
            body(static_cast<size_t>(i));
        } catch (...) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (!first_error) first_error = std::current_exception();
        }
    }
    #else
    // At most n_threads pool tasks, each pulling indices until none remain
    auto& pool = get_global_pool();
    const size_t count = end - begin;
    size_t n_tasks = n_threads > 0 ? static_cast<size_t>(n_threads) : pool.n_threads();
    n_tasks = std::min(n_tasks, count);

    std::atomic<size_t> next{begin};
    std::vector<std::future<void>> futures;
    futures.reserve(n_tasks);

    for (size_t t = 0; t < n_tasks; ++t) {
        futures.push_back(pool.submit([&]() {
            for (size_t i = next++; i < end; i = next++) {
                try {
                    body(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                }
            }
        }));
    }

    for (auto& f : futures) {
        f.wait();
    }
    #endif

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

// ============================================================================
// Thread Counts
// ============================================================================

int get_max_threads() {
    #ifdef _OPENMP
    return omp_get_max_threads();
    #else
    std::lock_guard<std::mutex> lock(pool_mutex);
    if (global_pool) return static_cast<int>(global_pool->n_threads());
    return static_cast<int>(std::max<unsigned>(1, std::thread::hardware_concurrency()));
    #endif
}

void set_num_threads(int n) {
    #ifdef _OPENMP
    omp_set_num_threads(n > 0 ? n : omp_get_num_procs());
    #else
    // Recreate thread pool with new size
    std::lock_guard<std::mutex> lock(pool_mutex);
    global_pool.reset();
    pool_size = n > 0 ? static_cast<size_t>(n) : 0;
    #endif
}

} // namespace threading
} // namespace canopy
