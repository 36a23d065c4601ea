// tests/test_framework/shared_test_helpers.h
#pragma once

/**
 * @file shared_test_helpers.h
 * @brief Common helpers for test cases: file I/O, polling and thread racing.
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace rangekv::tests::helper
{

/**
 * @brief Reads the entire contents of a file into a string.
 * @return True if the file was read successfully, false otherwise.
 */
bool read_file_contents(const std::string &path, std::string &out);

/**
 * @brief Polls @p pred every few milliseconds until it holds or @p timeout passes.
 */
bool wait_until(const std::function<bool()> &pred, std::chrono::milliseconds timeout);

/**
 * @brief A fresh, not yet existing path under the system temp directory.
 */
fs::path unique_temp_path(const std::string &stem);

/**
 * @brief Runs the same function on N threads released together.
 *
 * @code
 *   ThreadRacer racer(8);
 *   ASSERT_TRUE(racer.race([&](int i) { cache.insert(make_range(i)); }));
 * @endcode
 */
class ThreadRacer
{
  public:
    explicit ThreadRacer(int n_threads) : n_threads_(n_threads) {}

    /**
     * @brief Runs fn(thread_index) on n_threads simultaneously.
     *
     * All threads synchronize on a barrier before starting work, maximizing
     * the chance of true concurrency and exposing race conditions.
     *
     * @return true if all threads completed without throwing, false otherwise.
     */
    template <typename F> bool race(F fn)
    {
        exceptions_.clear();
        exceptions_.resize(static_cast<size_t>(n_threads_));

        std::atomic<int> ready_count{0};
        std::atomic<bool> start_flag{false};

        std::vector<std::thread> threads;
        threads.reserve(static_cast<size_t>(n_threads_));

        for (int i = 0; i < n_threads_; ++i)
        {
            threads.emplace_back(
                [&, i]()
                {
                    ready_count.fetch_add(1, std::memory_order_release);
                    // Spin until all threads are ready
                    while (!start_flag.load(std::memory_order_acquire))
                        std::this_thread::yield();
                    try
                    {
                        fn(i);
                    }
                    catch (...)
                    {
                        exceptions_[static_cast<size_t>(i)] = std::current_exception();
                    }
                });
        }

        // Wait until all threads are at the barrier
        while (ready_count.load(std::memory_order_acquire) < n_threads_)
            std::this_thread::yield();

        // Release all threads simultaneously
        start_flag.store(true, std::memory_order_release);

        for (auto &t : threads)
            t.join();

        return std::all_of(exceptions_.begin(), exceptions_.end(),
                           [](const std::exception_ptr &p) { return p == nullptr; });
    }

    const std::vector<std::exception_ptr> &exceptions() const { return exceptions_; }

  private:
    int n_threads_;
    std::vector<std::exception_ptr> exceptions_;
};

} // namespace rangekv::tests::helper
