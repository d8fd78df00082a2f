#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>
#include <vector>

#include "sr/concurrency.hpp"

using namespace sr;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_call_count_seq_par()
{
    for (int concurrency : {0, 1, 4, 64})
    {
        std::atomic<int> c{0};
        for_each_index_concurrent(
            37,
            concurrency,
            [&](int, const std::atomic<bool> &) { c.fetch_add(1, std::memory_order_relaxed); });
        assert_true(c.load() == 37, "call count == total");
    }
}

static void test_each_index_once()
{
    std::mutex mu;
    std::vector<int> seen(101, 0);
    for_each_index_concurrent(
        100,
        8,
        [&](int idx, const std::atomic<bool> &)
        {
            std::lock_guard<std::mutex> lk(mu);
            ++seen[idx];
        });
    assert_true(seen[0] == 0, "indices are 1-based");
    for (int i = 1; i <= 100; ++i) assert_true(seen[i] == 1, "each index exactly once");
}

static void test_sequential_order()
{
    std::vector<int> order;
    for_each_index_concurrent(5, 1, [&](int idx, const std::atomic<bool> &) { order.push_back(idx); });
    assert_true(order == std::vector<int>({1, 2, 3, 4, 5}), "sequential runs in index order");
}

static void test_total_zero()
{
    int calls = 0;
    for_each_index_concurrent(0, 4, [&](int, const std::atomic<bool> &) { ++calls; });
    for_each_index_concurrent(-3, 1, [&](int, const std::atomic<bool> &) { ++calls; });
    assert_true(calls == 0, "no work for empty range");
}

static void test_exception_propagation()
{
    std::atomic<int> c{0};
    bool caught = false;
    Cancellation cancel;
    try
    {
        for_each_index_concurrent(
            50,
            5,
            [&](int idx, const std::atomic<bool> &)
            {
                if (idx == 13) throw std::runtime_error("boom");
                c.fetch_add(1, std::memory_order_relaxed);
            },
            &cancel);
    }
    catch (const std::runtime_error &e)
    {
        caught = std::string_view(e.what()) == "boom";
    }
    assert_true(caught, "first exception rethrown");
    assert_true(cancel.is_cancelled(), "exception raises the cancel flag");
    assert_true(c.load() < 50, "the failing index did not count");
}

static void test_pre_cancel()
{
    std::atomic<int> c{0};
    Cancellation cancel;
    cancel.cancel();
    for_each_index_concurrent(
        100,
        8,
        [&](int, const std::atomic<bool> &) { c.fetch_add(1, std::memory_order_relaxed); },
        &cancel);
    assert_true(c.load() == 0, "pre-cancel -> no work");
}

static void test_seq_cancel_midway()
{
    std::atomic<int> c{0};
    Cancellation cancel;
    for_each_index_concurrent(
        20,
        1,
        [&](int idx, const std::atomic<bool> &)
        {
            c.fetch_add(1, std::memory_order_relaxed);
            if (idx == 5) cancel.cancel();
        },
        &cancel);
    assert_true(c.load() == 5, "seq cancel at 5 -> 5 calls");
}

static void test_token_observed()
{
    Cancellation cancel;
    std::atomic<bool> started{false};
    std::atomic<int> saw_cancel{0};
    for_each_index_concurrent(
        2,
        2,
        [&](int idx, const std::atomic<bool> &flag)
        {
            if (idx == 1)
            {
                while (!started.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
                cancel.cancel();
                return;
            }
            started.store(true);
            while (!flag.load(std::memory_order_relaxed))
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            saw_cancel.fetch_add(1);
        },
        &cancel);
    assert_true(saw_cancel.load() == 1, "running task observes the token");
}

static void test_slow_task_does_not_block_others()
{
    using namespace std::chrono;
    std::atomic<int> c{0};
    const auto t0 = steady_clock::now();
    for_each_index_concurrent(
        21,
        2,
        [&](int idx, const std::atomic<bool> &)
        {
            if (idx == 1) std::this_thread::sleep_for(milliseconds(200));
            else std::this_thread::sleep_for(milliseconds(5));
            c.fetch_add(1, std::memory_order_relaxed);
        });
    const auto dt = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert_true(c.load() == 21, "all tasks completed");
    // 20 short tasks run on the free worker while the slow one sleeps
    assert_true(dt.count() < 350, "short tasks overlap the slow one");
}

int main()
{
    test_call_count_seq_par();
    test_each_index_once();
    test_sequential_order();
    test_total_zero();
    test_exception_propagation();
    test_pre_cancel();
    test_seq_cancel_midway();
    test_token_observed();
    test_slow_task_does_not_block_others();

    std::cout << "concurrency tests: OK" << std::endl;
    return 0;
}
