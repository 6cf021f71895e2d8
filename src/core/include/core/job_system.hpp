#pragma once
#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <atomic>
#include <cstddef>

namespace vcam::core {

// Fixed-size worker pool. Jobs run in FIFO order; stop() drains the queue before joining.
class JobSystem {
public:
    using Job = std::function<void()>;

    JobSystem() = default;
    ~JobSystem();
    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;


    void start(unsigned threads = std::thread::hardware_concurrency());
    void stop();
    void enqueue(Job job);

    // Runs fn(0) .. fn(count-1) on the workers and blocks until all have returned.
    // The calling thread takes part, so this also works with zero workers started.
    void parallel_for(std::size_t count, const std::function<void(std::size_t)>& fn);

    bool running() const noexcept { return running_.load(); }
    std::size_t worker_count() const noexcept { return workers_.size(); }

private:
    void worker_loop();
    std::vector<std::thread> workers_;
    std::queue<Job> queue_;
    std::mutex m_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
};

} // namespace vcam::core
