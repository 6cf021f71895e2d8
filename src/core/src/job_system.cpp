#include "core/job_system.hpp"
#include <algorithm>
#include <memory>

namespace vcam::core {

JobSystem::~JobSystem() { stop(); }

void JobSystem::start(unsigned threads) {
    if(running_) return;
    running_ = true;
    if(threads==0) threads = 1;
    workers_.reserve(threads);
    for(unsigned i=0;i<threads;++i){
        workers_.emplace_back([this]{ worker_loop(); });
    }
}

void JobSystem::stop() {
    if(!running_) return;
    {
        std::lock_guard<std::mutex> lk(m_);
        running_ = false;
    }
    cv_.notify_all();
    for(auto& w : workers_) if(w.joinable()) w.join();
    workers_.clear();
}

void JobSystem::enqueue(Job job) {
    if(!running_) start();
    {
        std::lock_guard<std::mutex> lk(m_);
        queue_.push(std::move(job));
    }
    cv_.notify_one();
}

void JobSystem::parallel_for(std::size_t count, const std::function<void(std::size_t)>& fn) {
    if(count == 0) return;

    // Shared claim counter: workers and the caller pull indices until exhausted.
    struct Batch {
        std::atomic<std::size_t> next{0};
        std::size_t done = 0;
        std::mutex m;
        std::condition_variable cv;
    };
    auto batch = std::make_shared<Batch>();

    auto drain = [batch, count, &fn] {
        std::size_t finished = 0;
        for(std::size_t i = batch->next.fetch_add(1); i < count; i = batch->next.fetch_add(1)) {
            fn(i);
            ++finished;
        }
        if(finished == 0) return;
        std::lock_guard<std::mutex> lk(batch->m);
        batch->done += finished;
        if(batch->done == count) batch->cv.notify_all();
    };

    const std::size_t helpers = std::min(workers_.size(), count - 1);
    for(std::size_t h = 0; h < helpers; ++h) enqueue(drain);
    drain();

    // fn is borrowed by reference, so wait for every index before returning.
    std::unique_lock<std::mutex> lk(batch->m);
    batch->cv.wait(lk, [&]{ return batch->done == count; });
}

void JobSystem::worker_loop() {
    while(true){
        Job job;
        {
            std::unique_lock<std::mutex> lk(m_);
            cv_.wait(lk, [&]{ return !running_ || !queue_.empty(); });
            if(!running_ && queue_.empty()) break;
            job = std::move(queue_.front()); queue_.pop();
        }
        if(job) job();
    }
}

} // namespace vcam::core
