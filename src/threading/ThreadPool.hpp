#pragma once

// ============================================================================
// ThreadPool — fixed set of workers running per-table generation jobs
// ============================================================================
//
//   GenerationPipeline              Workers (worker_threads)
//   ──────────────────              ────────────────────────
//   submit(customers job) ──┐       Worker 0
//   submit(products job)  ──┤─> jobs_ ─> Worker 1
//   submit(transactions)  ──┤       ...
//   submit(interactions)  ──┘
//   future.get() per job  <──────── TableReport or rethrown exception
//
// Completion is observed only through the futures. get() on a table job
// blocks until that job finishes and yields its TableReport, or rethrows what
// the job threw. The destructor runs whatever is still queued before joining.
//
// Jobs share only read-only state (config, GenerationContext) and each owns
// its RandomStream, so the output does not depend on the number of workers
// or on the order in which they pick up jobs.
// ============================================================================

#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace RetailForge
{

    class ThreadPool
    {
    public:
        // worker_count == 0 is treated as 1.
        explicit ThreadPool(size_t worker_count)
        {
            const size_t n = worker_count == 0 ? 1 : worker_count;
            workers_.reserve(n);
            for (size_t i = 0; i < n; ++i)
                workers_.emplace_back(&ThreadPool::run_jobs, this);
        }

        // Jobs already queued still run; then every worker is joined.
        ~ThreadPool()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                closed_ = true;
            }
            wake_.notify_all();
            for (auto &worker : workers_)
                worker.join();
        }

        // Queues a nullary job. Its return value, or the exception it threw,
        // comes back through the future.
        template <typename Job>
        std::future<std::invoke_result_t<Job>> submit(Job job)
        {
            using Result = std::invoke_result_t<Job>;

            std::packaged_task<Result()> task(std::move(job));
            auto result = task.get_future();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_)
                    throw std::runtime_error("[ThreadPool] submit after shutdown");
                jobs_.emplace_back([task = std::move(task)]() mutable
                                   { task(); });
            }
            wake_.notify_one();
            return result;
        }

        size_t worker_count() const { return workers_.size(); }

        ThreadPool(const ThreadPool &) = delete;
        ThreadPool &operator=(const ThreadPool &) = delete;

    private:
        void run_jobs()
        {
            for (;;)
            {
                std::packaged_task<void()> job;
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    wake_.wait(lock, [this]
                               { return closed_ || !jobs_.empty(); });
                    if (jobs_.empty())
                        return;
                    job = std::move(jobs_.front());
                    jobs_.pop_front();
                }
                // Outside the lock: a table job runs for minutes.
                job();
            }
        }

        std::vector<std::thread> workers_;
        std::deque<std::packaged_task<void()>> jobs_; // guarded by mutex_
        std::mutex mutex_;
        std::condition_variable wake_;
        bool closed_ = false;
    };

} // namespace RetailForge
