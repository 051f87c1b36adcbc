#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <exception>

using namespace np::concurrency;

ThreadPool::ThreadPool(const unsigned int nThreads) {
    const auto n = std::max(1u, nThreads);
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

void ThreadPool::stop() { {
        std::scoped_lock lock(mutex);
        std::queue<std::shared_ptr<Task> > empty;
        std::swap(queue, empty);
    }

    stopFlag.store(true);
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable()) t.join();

    threads_.clear();
}

void ThreadPool::submit(std::shared_ptr<Task> task) { {
        std::scoped_lock lock(mutex);
        queue.push(std::move(task));
    }
    cv.notify_one();
}

unsigned int ThreadPool::workerCount() const {
    return static_cast<unsigned int>(threads_.size());
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (true) {
            std::shared_ptr<Task> task; {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] {
                    return stopFlag.load() || !queue.empty();
                });

                if (stopFlag.load() && queue.empty()) break;

                task = std::move(queue.front());
                queue.pop();
            }

            if (task) {
                try {
                    (*task)();
                } catch (const std::exception& e) {
                    // tasks report through their promise
                    if (log::Registry::isInitialized())
                        log::Registry::newsprobe()->error("[ThreadPool] Task threw: {}", e.what());
                }
            }
        }
    });
}
