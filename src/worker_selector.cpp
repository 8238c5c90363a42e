#include "worker_selector.h"

namespace droidrun {

std::vector<size_t> RoundRobinSelector::candidates(size_t pool_size) {
    std::vector<size_t> order;
    if (pool_size == 0) return order;

    size_t start = next_.fetch_add(1) % pool_size;
    order.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        order.push_back((start + i) % pool_size);
    }
    return order;
}

} // namespace droidrun
