// Fork/join worker pool used to evaluate independent subexpressions
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace xylo {

class TaskPool {
public:
    // threads == 0 picks the hardware concurrency; 1 runs everything inline.
    explicit TaskPool(unsigned threads = 0);
    ~TaskPool();
    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    unsigned threads() const { return threads_; }

    // Runs every job and returns once all started jobs have finished. The
    // calling thread runs any job no worker has claimed yet, so nested calls
    // from inside a job cannot starve. The first failure by job index is
    // rethrown; jobs not yet started when a failure is seen are skipped.
    void run(std::vector<std::function<void()>>& jobs);

private:
    struct Job {
        std::function<void()>* fn = nullptr;
        std::atomic<int> state{0}; // 0 pending, 1 claimed, 2 done
        std::exception_ptr error;
        std::mutex m;
        std::condition_variable cv;
        bool claim(){ int expected = 0; return state.compare_exchange_strong(expected, 1); }
        void execute();
        void wait();
    };

    void worker_loop();

    unsigned threads_ = 1;
    std::vector<std::thread> workers_;
    std::deque<std::shared_ptr<Job>> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool stopping_ = false;
};

} // namespace xylo
