#pragma once

#include <cstddef>
#include <vector>
#include <atomic>

namespace droidrun {

// Order in which the balancer offers a new task to the pool. Each index in
// [0, pool_size) appears exactly once; the first is the preferred worker.
class WorkerSelector {
public:
    virtual ~WorkerSelector() = default;
    virtual std::vector<size_t> candidates(size_t pool_size) = 0;
};

// Starts one position further along the pool on every call
class RoundRobinSelector : public WorkerSelector {
public:
    std::vector<size_t> candidates(size_t pool_size) override;

private:
    std::atomic<size_t> next_{0};
};

} // namespace droidrun
