#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <thread>
#include <type_traits>
#include <vector>

namespace wordhint::parallel {
    template <typename Func, typename... Args>
    concept VoidCallable = std::is_invocable_r_v<void, Func, Args...>;

    // One thread per pushed task, joined by wait()
    struct TaskQueue {
    private:
        std::vector<std::thread> threadPool;

    public:
        TaskQueue() noexcept = default;
        TaskQueue(std::size_t initialCapacity) {
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
        Splits jobs [0, numJobs) into at most numThreads contiguous chunks and
        runs func(threadID, start, stop) for each chunk on its own thread. Blocks until done.
        */
        template <typename Func>
            requires VoidCallable<Func&, std::size_t, std::size_t, std::size_t>
        void pushChunks(std::size_t numJobs, std::size_t numThreads, Func& func) {
            numThreads = std::max<std::size_t>(1, std::min(numJobs, numThreads));
            const std::size_t baseWork = numJobs / numThreads;
            const std::size_t extraWork = numJobs % numThreads;

            std::size_t threadID = 0;
            for (std::size_t start = 0; start < numJobs; ++threadID) {
                std::size_t stop = start + baseWork + static_cast<std::size_t>(threadID < extraWork);
                push(std::ref(func), threadID, start, stop);
                start = stop;
            }
            wait();
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
        std::size_t size() const noexcept {
            return threadPool.size();
        }

        // Returns capacity of threadPool
        std::size_t capacity() const noexcept {
            return threadPool.capacity();
        }
    };
}
