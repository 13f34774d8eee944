#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include "xylo/task_pool.hpp"

using namespace xylo;

static void test_results_in_order(unsigned threads){
    TaskPool pool(threads);
    std::vector<int> out(64, -1);
    std::vector<std::function<void()>> jobs;
    for(int i = 0; i < 64; ++i) jobs.push_back([&out, i]{ out[i] = i * i; });
    pool.run(jobs);
    for(int i = 0; i < 64; ++i) assert(out[i] == i * i);
}

static void test_first_error_by_index(unsigned threads){
    TaskPool pool(threads);
    std::vector<std::function<void()>> jobs;
    jobs.push_back([]{});
    jobs.push_back([]{ throw std::runtime_error("first"); });
    jobs.push_back([]{ throw std::runtime_error("second"); });
    std::string what;
    try { pool.run(jobs); }
    catch (const std::runtime_error& e){ what = e.what(); }
    assert(what == "first");
}

static void test_nested(){
    TaskPool pool(4);
    std::atomic<int> leaves{0};
    std::vector<std::function<void()>> outer;
    for(int i = 0; i < 8; ++i){
        outer.push_back([&]{
            std::vector<std::function<void()>> inner;
            for(int j = 0; j < 8; ++j) inner.push_back([&]{ ++leaves; });
            pool.run(inner);
        });
    }
    pool.run(outer);
    assert(leaves.load() == 64);
}

void run_task_pool_tests(){
    test_results_in_order(1);
    test_results_in_order(4);
    test_first_error_by_index(1);
    test_first_error_by_index(4);
    test_nested();
    assert(TaskPool(1).threads() == 1);
    std::cout << "TaskPool tests passed\n";
}
