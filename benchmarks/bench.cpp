#include <warc/weighted_ptr.h>
#include <warc/concurrency/thread_pool.h>
#include <chrono>
#include <iostream>
#include <memory>
#include <vector>
#include <atomic>
#include <cassert>
#include <cstdlib>
#include <string>

static inline double millis_since(
    const std::chrono::high_resolution_clock::time_point& t0)
{
    using namespace std::chrono;
    return duration<double, std::milli>(high_resolution_clock::now() - t0).count();
}

enum class mode { WEIGHTED, SHARED };

static mode parse_mode(const char* arg) {
    if (!arg) return mode::WEIGHTED;
    std::string s(arg);
    if (s == "shared") return mode::SHARED;
    return mode::WEIGHTED;
}

// Each job takes `fanout` copies of its own handle per round and drops them.
template <typename Ptr>
static void run(warc::conc::thread_pool& pool, const Ptr& root, int jobs, int rounds,
                int fanout, std::atomic<long long>& checksum)
{
    for (int j = 0; j < jobs; ++j) {
        Ptr mine(root);
        pool.submit([mine, rounds, fanout, &checksum] () {
            long long sum = 0;
            std::vector<Ptr> held;
            held.reserve(fanout);
            for (int r = 0; r < rounds; ++r) {
                for (int i = 0; i < fanout; ++i)
                    held.push_back(mine);
                for (auto it = held.begin(); it != held.end(); ++it)
                    sum += **it;
                held.clear();
            }
            checksum += sum;
        });
    }
    pool.barrier();
}

int main(int argc, char** argv)
{
    mode m      = parse_mode(argc > 1 ? argv[1] : nullptr);
    int  jobs   = argc > 2 ? std::atoi(argv[2]) : 64;
    int  rounds = argc > 3 ? std::atoi(argv[3]) : 10000;
    int  fanout = argc > 4 ? std::atoi(argv[4]) : 8;

    warc::conc::thread_pool pool;
    std::atomic<long long> checksum{0};

    auto t0 = std::chrono::high_resolution_clock::now();
    if (m == mode::WEIGHTED) {
        warc::weighted_ptr<int> root = warc::make_weighted<int>(1);
        run(pool, root, jobs, rounds, fanout, checksum);
        assert(root.is_unique());
    }
    else {
        std::shared_ptr<int> root = std::make_shared<int>(1);
        run(pool, root, jobs, rounds, fanout, checksum);
        assert(root.use_count() == 1);
    }
    double ms = millis_since(t0);
    std::cerr << ">>> finished copies\n";

    const char* name = m == mode::WEIGHTED ? "weighted" : "shared";
    std::cout << "pointer=" << name << " threads=" << pool.size() << " jobs=" << jobs
              << " rounds=" << rounds << " fanout=" << fanout
              << " elapsed_ms=" << ms << " checksum=" << checksum.load() << '\n';

    long long expected = static_cast<long long>(jobs) * rounds * fanout;
    assert(checksum.load() == expected && "checksum mismatch");

    return checksum.load() == expected ? 0 : 1;
}
