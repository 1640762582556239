/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#ifndef _WARC_CONCURRENCY_THREAD_POOL_H_
#define _WARC_CONCURRENCY_THREAD_POOL_H_

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace warc { namespace conc {

/*!
 * Worker count taken from the WARC_THREADS environment variable, falling
 * back to the hardware concurrency. Never less than 1.
 */
unsigned default_threads();

class thread_pool {
public:
    explicit thread_pool(unsigned n = default_threads());
    ~thread_pool();

    void submit(std::function<void()> fn);
    void barrier(); // wait for all tasks queued so far
    unsigned size() const { return unsigned(workers.size()); }

private:
    void worker();
    std::vector<std::thread> workers;
    std::queue<std::function<void()>> q;
    std::mutex mx;
    std::condition_variable cv;
    std::condition_variable idle;
    bool done;
    unsigned in_flight;
};

} }

#endif
