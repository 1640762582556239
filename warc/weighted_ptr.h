/**
 * Copyright (c) 2012-2014, Stephen Blackheath and Anthony Jones
 * Released under a BSD3 licence.
 *
 * C++ implementation courtesy of International Telematics Ltd.
 */
#ifndef _WARC_WEIGHTED_PTR_H_
#define _WARC_WEIGHTED_PTR_H_

#include <warc/config.h>
#include <warc/weight.h>
#include <boost/optional.hpp>
#include <boost/functional/hash.hpp>
#include <atomic>
#include <cassert>
#include <functional>
#include <memory>
#include <ostream>
#include <utility>

namespace warc {

    namespace impl {

        /*!
         * The single heap block behind every handle of one value. It has no
         * owner of its own: whichever handle returns the last of the weight
         * deletes it.
         */
        template <typename T>
        struct shared_cell {
            template <typename... Args>
            explicit shared_cell(Args&&... args)
                : weight(initial_weight),
                  value(std::forward<Args>(args)...)
            {
            }

            std::atomic<weight_t> weight;
            T value;
        };
    }

    /*!
     * Shared, read-only ownership of one heap value, with weighted reference
     * counting.
     *
     * Each handle holds a power-of-two share of the cell's weight. Copying a
     * handle halves that share between the old handle and the new one, so a
     * copy normally touches no shared memory. Only a handle whose share is
     * down to 1 goes back to the cell for a fresh block, with a single CAS.
     * Destroying a handle subtracts its share; the handle that brings the
     * cell to zero frees it.
     *
     * Because a copy modifies its source, one handle object must not be
     * copied, assigned or destroyed by two threads at once. Separate handles
     * to the same value can be used from any threads without coordination.
     */
    template <typename T>
    class weighted_ptr {
    private:
        typedef impl::shared_cell<T> cell_t;

        explicit weighted_ptr(cell_t* cell_)
            : local(impl::initial_weight),
              cell(cell_)
        {
        }

        mutable weight_t local;
        cell_t* cell;

    public:
        /*!
         * An empty handle. It owns nothing and carries no weight.
         */
        weighted_ptr() : local(0), cell(nullptr) {}

        static weighted_ptr<T> create(T value)
        {
            return weighted_ptr<T>(new cell_t(std::move(value)));
        }

        template <typename... Args>
        static weighted_ptr<T> make_in_place(Args&&... args)
        {
            return weighted_ptr<T>(new cell_t(std::forward<Args>(args)...));
        }

        weighted_ptr(const weighted_ptr& other)
            : local(other.cell != nullptr ? impl::split(other.local, other.cell->weight) : 0),
              cell(other.cell)
        {
        }

        weighted_ptr(weighted_ptr&& other) noexcept
            : local(other.local),
              cell(other.cell)
        {
            other.local = 0;
            other.cell = nullptr;
        }

        ~weighted_ptr()
        {
            reset();
        }

        weighted_ptr& operator = (const weighted_ptr& other)
        {
            if (this != &other) {
                weighted_ptr dup(other);
                swap(dup);
            }
            return *this;
        }

        weighted_ptr& operator = (weighted_ptr&& other) noexcept
        {
            if (this != &other) {
                reset();
                local = other.local;
                cell = other.cell;
                other.local = 0;
                other.cell = nullptr;
            }
            return *this;
        }

        /*!
         * Give this handle's weight back to the cell, freeing the value if
         * no weight remains outstanding. Leaves the handle empty.
         */
        void reset()
        {
            if (cell == nullptr)
                return;
            cell_t* c = cell;
            weight_t w = local;
            cell = nullptr;
            local = 0;
            if (impl::return_weight(c->weight, w)) {
                // pairs with the release subtraction of every other handle
                std::atomic_thread_fence(std::memory_order_acquire);
                delete c;
            }
        }

        weighted_ptr clone() const
        {
            return weighted_ptr(*this);
        }

        void swap(weighted_ptr& other) noexcept
        {
            std::swap(local, other.local);
            std::swap(cell, other.cell);
        }

        const T& operator * () const
        {
            assert(cell != nullptr);
            return cell->value;
        }

        const T* operator -> () const
        {
            assert(cell != nullptr);
            return std::addressof(cell->value);
        }

        const T* get() const
        {
            return cell != nullptr ? std::addressof(cell->value) : nullptr;
        }

        bool valid() const { return cell != nullptr; }
        explicit operator bool () const { return cell != nullptr; }

        /*!
         * Weight this handle may return on release. 0 for an empty handle.
         */
        weight_t local_weight() const { return local; }

        /*!
         * Weight currently outstanding against the cell. Only meaningful as a
         * snapshot while other threads may hold handles.
         */
        weight_t shared_weight() const
        {
            return cell != nullptr ? cell->weight.load(std::memory_order_acquire) : 0;
        }

        /*!
         * True if this handle holds all the weight, so no other handle to
         * the value exists. Nobody else can create one either.
         */
        bool is_unique() const
        {
            return cell != nullptr && cell->weight.load(std::memory_order_acquire) == local;
        }

        /*!
         * If this is the only handle, move the value out, free the cell and
         * leave the handle empty. Otherwise return none and change nothing.
         */
        boost::optional<T> try_unwrap()
        {
            if (!is_unique())
                return boost::optional<T>();
            boost::optional<T> value(std::move(cell->value));
            delete cell;
            cell = nullptr;
            local = 0;
            return value;
        }
    };

    template <typename T, typename... Args>
    weighted_ptr<T> make_weighted(Args&&... args)
    {
        return weighted_ptr<T>::make_in_place(std::forward<Args>(args)...);
    }

    template <typename T>
    void swap(weighted_ptr<T>& a, weighted_ptr<T>& b) noexcept
    {
        a.swap(b);
    }

    /*!
     * True if both handles share one cell, as opposed to holding equal values.
     */
    template <typename T>
    bool ptr_eq(const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return a.get() == b.get();
    }

    // Comparisons look through to the values. An empty handle equals another
    // empty handle and orders before any value.
    template <typename T>
    bool operator == (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return a && b ? *a == *b : !a && !b;
    }

    template <typename T>
    bool operator != (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return !(a == b);
    }

    template <typename T>
    bool operator < (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        if (!b)
            return false;
        if (!a)
            return true;
        return *a < *b;
    }

    template <typename T>
    bool operator <= (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return !(b < a);
    }

    template <typename T>
    bool operator > (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return b < a;
    }

    template <typename T>
    bool operator >= (const weighted_ptr<T>& a, const weighted_ptr<T>& b)
    {
        return !(a < b);
    }

    template <typename T>
    std::ostream& operator << (std::ostream& os, const weighted_ptr<T>& p)
    {
        if (!p)
            return os << "(empty)";
        return os << *p;
    }

    // Picked up by boost::hash.
    template <typename T>
    std::size_t hash_value(const weighted_ptr<T>& p)
    {
        return p ? boost::hash<T>()(*p) : 0;
    }
}

namespace std {
    template <typename T>
    struct hash<warc::weighted_ptr<T>> {
        std::size_t operator () (const warc::weighted_ptr<T>& p) const
        {
            return p ? std::hash<T>()(*p) : 0;
        }
    };
}

#endif
