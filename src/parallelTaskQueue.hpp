#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace guesswork::parallel {
    template <typename Func, typename... Args>
    concept VoidCallable = std::is_invocable_r_v<void, Func, Args...>;

    // Number of workers to use when the caller does not say
    inline size_t defaultConcurrency() noexcept {
        return std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    struct TaskQueue {
    private:
        std::vector<std::thread> threadPool;

    public:
        TaskQueue() noexcept = default;
        explicit TaskQueue(std::size_t initialCapacity) {
            threadPool.reserve(initialCapacity);
        }
        TaskQueue(const TaskQueue&) = delete;
        TaskQueue& operator=(const TaskQueue&) = delete;
        ~TaskQueue() { wait(); }

        template <typename Func, typename... Args>
            requires VoidCallable<Func, Args...>
        void push(Func&& func, Args&&... args) {
            threadPool.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
        }

        /*
        Splits [0, numJobs) into at most numThreads contiguous chunks of near-equal size and
        runs func(threadID, start, stop) for each chunk. Does not wait.
        */
        template <typename Func>
            requires VoidCallable<Func, size_t, size_t, size_t>
        void pushChunked(size_t numJobs, size_t numThreads, Func func) {
            numThreads = std::max<size_t>(1, std::min(numThreads, numJobs));
            const size_t baseWork = numJobs / numThreads;
            const size_t extraWork = numJobs % numThreads;

            size_t threadID = 0;
            for (size_t start = 0; start < numJobs; ++threadID) {
                const size_t stop = start + baseWork + static_cast<size_t>(threadID < extraWork);
                push(func, threadID, start, stop);
                start = stop;
            }
        }

        // Blocks local thread until all tasks finish
        void wait() {
            while (!threadPool.empty()) {
                auto thread = std::move(threadPool.back());
                threadPool.pop_back();
                thread.join();
            }
        }

        // Returns number of threads in TaskQueue
        size_t size() const noexcept {
            return threadPool.size();
        }

        // Returns capacity of threadPool
        size_t capacity() const noexcept {
            return threadPool.capacity();
        }
    };
}
