#pragma once

#include <berry_mcp/core/blocking_queue.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace berry_mcp {

// ---------------------------------------------------------------------------
// WorkerPool: fixed set of threads draining a job queue.
//
// Used for blocking tool bodies (so they never run on a transport thread)
// and for the SSE transport's background tools/call execution.
// Shutdown() lets queued jobs finish, then joins.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads, std::string name = "pool");
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Schedule fn; the returned future carries its value or exception.
    // Throws std::runtime_error after Shutdown().
    template <typename Fn>
    auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using R = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        if (!jobs_.Push([task] { (*task)(); })) {
            throw std::runtime_error("WorkerPool '" + name_ + "' is shut down");
        }
        return future;
    }

    void Shutdown();

    [[nodiscard]] std::size_t ThreadCount() const noexcept { return threads_.size(); }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }

private:
    void WorkerLoop();

    std::string name_;
    BlockingQueue<std::function<void()>> jobs_;
    std::vector<std::thread> threads_;
};

} // namespace berry_mcp
