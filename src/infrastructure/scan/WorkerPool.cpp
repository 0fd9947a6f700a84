#include "infrastructure/scan/WorkerPool.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <system_error>

namespace devsweep::infra {

WorkerPool::WorkerPool(size_t workerCount, ThreadLauncher launcher)
    : ioContext_(static_cast<int>(workerCount > 0 ? workerCount : 1)),
      launcher_(std::move(launcher)),
      workerCount_(workerCount > 0 ? workerCount : 1) {
    if (!launcher_) {
        launcher_ = [](std::function<void()> body) { return std::thread(std::move(body)); };
    }
}

WorkerPool::~WorkerPool() {
    join();
}

size_t WorkerPool::run(WorkerLoop loop) {
    if (started_) {
        throw std::logic_error("WorkerPool can only be run once");
    }
    started_ = true;

    auto shared = std::make_shared<WorkerLoop>(std::move(loop));

    // Threads block in run_one() until their loop is posted
    auto workGuard = asio::make_work_guard(ioContext_);

    threads_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        try {
            threads_.push_back(launcher_([this, i]() {
                ioContext_.run_one();
                spdlog::trace("Pool thread {} finished", i);
            }));
        } catch (const std::system_error& e) {
            spdlog::error("Started only {} of {} pool threads: {}", i, workerCount_, e.what());
            break;
        }
        asio::post(ioContext_, [shared, i]() { (*shared)(i); });
    }

    workGuard.reset();
    spdlog::debug("Worker pool running {} workers", threads_.size());
    return threads_.size();
}

void WorkerPool::join() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

} // namespace devsweep::infra
