/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#include <warc/concurrency/thread_pool.h>
#include <cstdlib>

using namespace warc::conc;

unsigned warc::conc::default_threads()
{
    const char* env = ::getenv("WARC_THREADS");
    int n = env ? std::atoi(env) : int(std::thread::hardware_concurrency());
    return n > 0 ? unsigned(n) : 1u;
}

thread_pool::thread_pool(unsigned n)
    : done(false),
      in_flight(0)
{
    if (n == 0) n = 1;
    workers.reserve(n);
    for (unsigned i = 0; i < n; ++i)
        workers.emplace_back([this]{ worker(); });
}

thread_pool::~thread_pool() {
    {
        std::lock_guard<std::mutex> lk(mx);
        done = true;
    }
    cv.notify_all();
    for (auto& t : workers) t.join();
}

void thread_pool::submit(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lk(mx);
        q.push(std::move(fn));
        ++in_flight;
    }
    cv.notify_one();
}

void thread_pool::barrier() {
    std::unique_lock<std::mutex> lk(mx);
    idle.wait(lk, [this]{ return in_flight == 0; });
}

void thread_pool::worker() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lk(mx);
            cv.wait(lk, [this]{ return done || !q.empty(); });
            if (done && q.empty()) return;
            job = std::move(q.front()); q.pop();
        }
        job();
        // drop anything the job captured before reporting it finished
        job = nullptr;
        {
            std::lock_guard<std::mutex> lk(mx);
            if (--in_flight == 0)
                idle.notify_all();
        }
    }
}
