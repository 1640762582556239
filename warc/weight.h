/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#ifndef _WARC_WEIGHT_H_
#define _WARC_WEIGHT_H_

#include <warc/config.h>
#include <atomic>
#include <cstddef>

namespace warc {

    typedef std::size_t weight_t;

    namespace impl {

        constexpr bool is_power_of_two(weight_t w)
        {
            return w != 0 && (w & (w - 1)) == 0;
        }

        constexpr weight_t initial_weight = WARC_INITIAL_WEIGHT;

        static_assert(is_power_of_two(initial_weight) && initial_weight >= 2,
                      "WARC_INITIAL_WEIGHT must be a power of two of at least 2");

        /*!
         * Slow-path counters for the calling thread. They only move when a
         * handle has to go back to the shared counter, so the fast path of
         * duplication never touches them.
         */
        struct weight_stats {
            weight_stats() : withdrawals(0), cas_failures(0) {}
            unsigned long long withdrawals;
            unsigned long long cas_failures;
        };

        weight_stats& this_thread_stats();

        /*!
         * Add initial_weight - 1 to the shared counter with a CAS loop and
         * return the amount added, which the caller credits to its own local
         * weight. Reports "weight ceiling exceeded" through WARC_THROW (or
         * aborts under WARC_NO_EXCEPTIONS) if the counter would wrap; the
         * counter is left untouched in that case.
         */
        weight_t withdraw(std::atomic<weight_t>& shared);

        /*!
         * Halve a local weight in preparation for a duplicate, withdrawing
         * first if it is down to 1. Returns the weight for the new handle,
         * which is also what remains in local.
         */
        inline weight_t split(weight_t& local, std::atomic<weight_t>& shared)
        {
            if (local == 1)
                local += withdraw(shared);
            local >>= 1;
            return local;
        }

        /*!
         * Give local back to the shared counter. True when this emptied the
         * counter, i.e. the value before the subtraction was exactly local.
         * The caller then owns the cell and must fence before freeing it.
         */
        inline bool return_weight(std::atomic<weight_t>& shared, weight_t local)
        {
            return shared.fetch_sub(local, std::memory_order_release) == local;
        }
    }
}

#endif
