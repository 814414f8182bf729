#include "worker_pool.hpp"
#include "freight_errors.hpp"
#include <format>

WorkerPool::WorkerPool(int workers) : workers(workers) {
    if (workers < FreightConfig::kMinProcessingThreads || workers > FreightConfig::kMaxProcessingThreads) {
        throw ConfigurationError(std::format("Worker count must be between {} and {}, got {}",
                                             FreightConfig::kMinProcessingThreads, FreightConfig::kMaxProcessingThreads,
                                             workers));
    }
}

WorkerPool::~WorkerPool() {
    finish();
}

bool WorkerPool::start(ContextProcessor processor) {
    if (running.load() || !processor) {
        return false;
    }

    this->processor = std::move(processor);
    closing.store(false);
    running.store(true);

    workerThreads.reserve(workers);
    for (int i = 0; i < workers; ++i) {
        workerThreads.emplace_back(&WorkerPool::workerLoop, this, i);
    }
    return true;
}

void WorkerPool::submit(std::shared_ptr<const JobContext> context) {
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        jobQueue.push(std::move(context));
    }
    jobAvailable.notify_one();
}

void WorkerPool::finish() {
    if (!running.load()) {
        return;
    }

    // Workers leave once the queue is empty and closing is set
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        closing.store(true);
    }
    jobAvailable.notify_all();

    for (auto& thread : workerThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads.clear();
    running.store(false);
}

std::size_t WorkerPool::queueSize() const {
    std::lock_guard<std::mutex> lock(queueMutex);
    return jobQueue.size();
}

void WorkerPool::workerLoop(int workerId) {
    while (true) {
        std::shared_ptr<const JobContext> context;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            jobAvailable.wait(lock, [this] { return !jobQueue.empty() || closing.load(); });
            if (jobQueue.empty()) {
                break;
            }
            context = std::move(jobQueue.front());
            jobQueue.pop();
        }
        processor(context, workerId);
    }
}
