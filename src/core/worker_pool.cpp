#include <berry_mcp/core/worker_pool.hpp>

#include <berry_mcp/core/log.hpp>

#include <exception>

namespace berry_mcp {

WorkerPool::WorkerPool(std::size_t threads, std::string name)
    : name_(std::move(name)) {
    if (threads == 0) threads = 1;
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this] { WorkerLoop(); });
    }
    LogDebug("pool", "Started '" + name_ + "' with " +
                         std::to_string(threads) + " threads");
}

WorkerPool::~WorkerPool() {
    Shutdown();
}

void WorkerPool::Shutdown() {
    jobs_.Close();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::WorkerLoop() {
    while (auto job = jobs_.Pop()) {
        // packaged_task stores exceptions in its future; anything reaching
        // here escaped a job wrapper.
        try {
            (*job)();
        } catch (const std::exception& e) {
            LogError("pool", "Job in '" + name_ + "' threw: " + e.what());
        } catch (...) {
            LogError("pool", "Job in '" + name_ + "' threw an unknown exception");
        }
    }
}

} // namespace berry_mcp
