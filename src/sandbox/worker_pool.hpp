#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace threatweaver::sandbox {

// Bounded pool for blocking remote calls. Callers hold a future and choose
// how long to wait for it.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        return future;
    }

    std::size_t Threads() const { return threads_; }

private:
    std::size_t threads_;
    boost::asio::thread_pool pool_;
};

}  // namespace threatweaver::sandbox
