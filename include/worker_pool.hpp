/**
 * @file worker_pool.hpp
 * @brief Fixed-size pool of worker threads for job contexts.
 *
 * Each worker takes one job context at a time and runs it to completion before taking the
 * next. Every submitted context is handed to exactly one worker.
 */

#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include "job.hpp"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

using ContextProcessor = std::function<void(const std::shared_ptr<const JobContext>&, int workerId)>;

class WorkerPool {
public:
    explicit WorkerPool(int workers);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Starts the worker threads.
     *
     * @param processor Called once per submitted context. Must not throw.
     * @return bool False if the pool is already running or the processor is empty.
     */
    [[nodiscard]] bool start(ContextProcessor processor);

    /**
     * @brief Queues a context for the next free worker.
     */
    void submit(std::shared_ptr<const JobContext> context);

    /**
     * @brief Waits until every queued context has been processed, then stops the workers.
     */
    void finish();

    [[nodiscard]] std::size_t queueSize() const;
    [[nodiscard]] int workerCount() const { return workers; }

private:
    void workerLoop(int workerId);

    int workers;
    ContextProcessor processor;

    std::atomic<bool> running{false};
    std::atomic<bool> closing{false};

    mutable std::mutex queueMutex;
    std::condition_variable jobAvailable;
    std::queue<std::shared_ptr<const JobContext>> jobQueue;

    std::vector<std::thread> workerThreads;
};

#endif // WORKER_POOL_HPP
