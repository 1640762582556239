/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#include <warc/weight.h>
#include <iostream>
#include <limits>

namespace warc {
    namespace impl {

        static void weight_ceiling_exceeded(weight_t current)
        {
#if defined(WARC_NO_EXCEPTIONS)
            std::cerr << "warc: weight ceiling exceeded (shared weight "
                      << current << ")" << std::endl;
            abort();
#else
            (void)current;
            WARC_THROW("weight ceiling exceeded");
#endif
        }

        weight_stats& this_thread_stats()
        {
            static thread_local weight_stats stats;
            return stats;
        }

        weight_t withdraw(std::atomic<weight_t>& shared)
        {
            const weight_t grant = initial_weight - 1;
            weight_stats& stats = this_thread_stats();
            weight_t current = shared.load(std::memory_order_acquire);
            while (true) {
                if (current > std::numeric_limits<weight_t>::max() - grant)
                    weight_ceiling_exceeded(current);
                weight_t next = current + grant;
                if (shared.compare_exchange_weak(current, next,
                                                 std::memory_order_acq_rel,
                                                 std::memory_order_acquire)) {
                    stats.withdrawals++;
                    return next - current;
                }
                // current now holds the value that beat us
                stats.cas_failures++;
            }
        }

    }
}
