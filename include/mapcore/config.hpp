// config.hpp
// Tuning constants and construction options shared by the containers.

#ifndef MAPCORE_CONFIG_HPP
#define MAPCORE_CONFIG_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "errors.hpp"
#include "log.hpp"

namespace mapcore
{

    /*===========================================================================
     *  Hash table tuning
     *===========================================================================*/

    /* Capacity used when the table is first allocated without a request. */
    constexpr std::size_t DEFAULT_INITIAL_CAPACITY = std::size_t{1} << 4;

    /* Largest bucket array; growth past it only raises the threshold. */
    constexpr std::size_t MAXIMUM_CAPACITY = std::size_t{1} << 30;

    constexpr float DEFAULT_LOAD_FACTOR = 0.75f;

    /* A list-form bucket whose chain passes this many entries is promoted
       to tree form (or the table grows instead, see MIN_TREEIFY_CAPACITY). */
    constexpr int TREEIFY_THRESHOLD = 8;

    /* A split tree half with at most this many entries goes back to a list. */
    constexpr int UNTREEIFY_THRESHOLD = 6;

    /* Below this capacity a long chain grows the table instead of
       becoming a tree. */
    constexpr std::size_t MIN_TREEIFY_CAPACITY = 64;

    /* Threshold once the table can no longer grow. */
    constexpr std::size_t THRESHOLD_UNBOUNDED = std::numeric_limits<std::size_t>::max();

    /*===========================================================================
     *  Sequence tuning
     *===========================================================================*/

    constexpr std::size_t DEFAULT_LIST_CAPACITY = 10;

    /* Leave head-room below the addressable maximum, like the array growth
       policy of the JVM collections this library mirrors. */
    constexpr std::size_t MAX_ARRAY_SIZE =
        static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max()) - 8;

    /*-------------------------------------------------------------------------
     *  table_size_for
     *-------------------------------------------------------------------------
     *  Smallest power of two >= cap, clamped to [1, MAXIMUM_CAPACITY].
     *-------------------------------------------------------------------------*/
    constexpr std::size_t table_size_for(std::size_t cap) noexcept
    {
        if (cap >= MAXIMUM_CAPACITY)
            return MAXIMUM_CAPACITY;
        std::size_t n = 1;
        while (n < cap)
            n <<= 1;
        return n;
    }

    /*-------------------------------------------------------------------------
     *  struct HashOptions
     *-------------------------------------------------------------------------
     *  Construction parameters of HashMap / LinkedHashMap.
     *
     *  initial_capacity – requested bucket count; rounded up to a power of
     *                     two and capped at MAXIMUM_CAPACITY.  Signed so a
     *                     negative request can be reported instead of
     *                     wrapping around.
     *  load_factor      – size/capacity ratio that triggers doubling.
     *  access_order     – overlay mode: false = insertion order,
     *                     true = access order (LRU).  Ignored by a plain
     *                     HashMap.
     *-------------------------------------------------------------------------*/
    struct HashOptions
    {
        std::int64_t initial_capacity{static_cast<std::int64_t>(DEFAULT_INITIAL_CAPACITY)};
        float load_factor{DEFAULT_LOAD_FACTOR};
        bool access_order{false};

        /* Throws InvalidArgument for a negative capacity or a load factor
           that is NaN or not strictly positive. */
        void validate() const
        {
            if (initial_capacity < 0)
                throw InvalidArgument("Illegal initial capacity: " + std::to_string(initial_capacity));
            if (std::isnan(load_factor) || !(load_factor > 0.0f))
                throw InvalidArgument("Illegal load factor: " + util::detail::to_string(load_factor));
        }

        std::size_t requested_capacity() const noexcept
        {
            auto cap = static_cast<std::uint64_t>(initial_capacity);
            if (cap > MAXIMUM_CAPACITY)
                cap = MAXIMUM_CAPACITY;
            return table_size_for(static_cast<std::size_t>(cap));
        }
    };

} // namespace mapcore

#endif // MAPCORE_CONFIG_HPP
