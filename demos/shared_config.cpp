#include <warc/weighted_ptr.h>
#include <warc/concurrency/thread_pool.h>
#include <atomic>
#include <iostream>
#include <map>
#include <string>

struct Config
{
    std::string name;
    std::map<std::string, int> limits;
};

std::ostream& operator << (std::ostream& os, const Config& c)
{
    os << c.name << " {";
    for (auto it = c.limits.begin(); it != c.limits.end(); ++it)
        os << ' ' << it->first << '=' << it->second;
    return os << " }";
}

int main() {
    Config c;
    c.name = "ingest";
    c.limits["batch"] = 64;
    c.limits["retries"] = 3;
    warc::weighted_ptr<Config> config = warc::weighted_ptr<Config>::create(c);
    std::cout << "sharing " << config << '\n';

    std::atomic<long long> batches{0};
    {
        warc::conc::thread_pool pool;
        for (int i = 0; i < 100; ++i) {
            warc::weighted_ptr<Config> mine = config.clone();
            pool.submit([mine, &batches] () {
                batches += mine->limits.at("batch");
            });
        }
        pool.barrier();
    }

    std::cout << "batches=" << batches.load()
              << " unique=" << (config.is_unique() ? "yes" : "no") << '\n';
}
