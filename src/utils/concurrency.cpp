#include "sr/concurrency.hpp"

#include <algorithm>
#include <thread>
#include <vector>
#include <mutex>
#include <exception>

namespace sr {

void for_each_index_concurrent(
    int total,
    int concurrency,
    const std::function<void(int, const std::atomic<bool>&)>& fn,
    Cancellation* cancel)
{
    if (total <= 0) return;

    std::atomic<bool> local_cancel{false};
    const std::atomic<bool>& flag = cancel ? cancel->flag() : local_cancel;

    std::mutex ex_mtx;
    std::exception_ptr first_ex = nullptr;

    auto safe_call = [&](int idx) {
        try {
            fn(idx, flag);
        } catch (...) {
            {
                std::scoped_lock lk(ex_mtx);
                if (!first_ex) first_ex = std::current_exception();
            }
            if (cancel) cancel->cancel(); else local_cancel.store(true, std::memory_order_relaxed);
        }
    };

    if (concurrency <= 1)
    {
        for (int i = 1; i <= total && !flag.load(std::memory_order_relaxed); ++i)
        {
            safe_call(i);
        }
    }
    else
    {
        // Each worker pulls the next index as soon as it is free, so one
        // slow task only occupies its own slot.
        std::atomic<int> next{1};
        auto worker = [&] {
            for (;;)
            {
                if (flag.load(std::memory_order_relaxed)) return;
                const int idx = next.fetch_add(1, std::memory_order_relaxed);
                if (idx > total) return;
                safe_call(idx);
            }
        };

        const int n = std::min(concurrency, total);
        std::vector<std::thread> threads;
        threads.reserve(n);
        for (int i = 0; i < n; ++i) threads.emplace_back(worker);
        for (auto& th : threads) th.join();
    }

    if (first_ex) std::rethrow_exception(first_ex);
}

} // namespace sr
