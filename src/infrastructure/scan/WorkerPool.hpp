#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace devsweep::infra {

/**
 * @brief Fixed set of threads, each running one long-lived worker loop.
 *
 * Every thread runs exactly one handler from a private io_context, and a
 * loop is posted only once its thread exists, so the number of executing
 * loops never exceeds the number of threads that started. The threads
 * exit on their own once their loop returns; join() only waits for that.
 *
 * @note Non-copyable. join() must not be called from inside a worker loop.
 */
class WorkerPool {
public:
    using WorkerLoop = std::function<void(size_t workerIndex)>;

    /**
     * @brief Creates a thread running the given body. May throw std::system_error.
     */
    using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

    /**
     * @param workerCount Number of threads and worker loops (at least 1).
     * @param launcher Thread factory; defaults to constructing a std::thread.
     */
    explicit WorkerPool(size_t workerCount, ThreadLauncher launcher = {});

    /**
     * @brief Destructor. Joins all threads.
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Starts up to workerCount() threads, each executing loop once.
     *
     * Stops launching at the first thread that cannot be created. Loops are
     * handed indices 0..n-1 where n is the returned count.
     *
     * @return Number of threads, and therefore loops, that started.
     * @throws std::logic_error if the pool was already started.
     */
    size_t run(WorkerLoop loop);

    /**
     * @brief Waits for every worker loop to return and joins the threads.
     */
    void join();

    size_t workerCount() const { return workerCount_; }

private:
    asio::io_context ioContext_;
    ThreadLauncher launcher_;
    std::vector<std::thread> threads_;
    size_t workerCount_;
    bool started_{false};
};

} // namespace devsweep::infra
