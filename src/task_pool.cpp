#include "xylo/task_pool.hpp"

namespace xylo {

void TaskPool::Job::execute(){
    try { (*fn)(); }
    catch (...) { error = std::current_exception(); }
    {
        std::lock_guard<std::mutex> lk(m);
        state.store(2);
    }
    cv.notify_all();
}

void TaskPool::Job::wait(){
    std::unique_lock<std::mutex> lk(m);
    cv.wait(lk, [&]{ return state.load() == 2; });
}

TaskPool::TaskPool(unsigned threads){
    if(threads == 0) threads = std::thread::hardware_concurrency();
    threads_ = threads == 0 ? 1 : threads;
    // The joining thread always participates, so spawn one fewer worker.
    for(unsigned i = 1; i < threads_; ++i) workers_.emplace_back([this]{ worker_loop(); });
}

TaskPool::~TaskPool(){
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for(auto& t : workers_) t.join();
}

void TaskPool::worker_loop(){
    for(;;){
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lk(queue_mutex_);
            queue_cv_.wait(lk, [&]{ return stopping_ || !queue_.empty(); });
            if(queue_.empty()) return;
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        if(job->claim()) job->execute();
    }
}

void TaskPool::run(std::vector<std::function<void()>>& jobs){
    if(jobs.empty()) return;
    if(workers_.empty() || jobs.size() == 1){
        for(auto& fn : jobs) fn();
        return;
    }
    std::vector<std::shared_ptr<Job>> handles;
    handles.reserve(jobs.size());
    for(auto& fn : jobs){
        auto job = std::make_shared<Job>();
        job->fn = &fn;
        handles.push_back(std::move(job));
    }
    {
        std::lock_guard<std::mutex> lk(queue_mutex_);
        for(size_t i = 1; i < handles.size(); ++i) queue_.push_back(handles[i]);
    }
    queue_cv_.notify_all();

    bool failed = false;
    for(auto& job : handles){
        if(job->claim()){
            if(failed){
                // cancelled: mark done without running
                std::lock_guard<std::mutex> lk(job->m);
                job->state.store(2);
                continue;
            }
            job->execute();
        } else {
            job->wait();
        }
        if(job->error) failed = true;
    }
    for(auto& job : handles) if(job->error) std::rethrow_exception(job->error);
}

} // namespace xylo
