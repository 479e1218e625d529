#include "sandbox/worker_pool.hpp"

#include <algorithm>

namespace threatweaver::sandbox {

WorkerPool::WorkerPool(std::size_t threads)
    : threads_(std::max<std::size_t>(threads, 1))
    , pool_(threads_) {}

WorkerPool::~WorkerPool() {
    pool_.join();
}

}  // namespace threatweaver::sandbox
