// key_traits.hpp
// Compile-time facts about key types: "absent" (null) keys, natural
// ordering, and whether a key type can be ordered with operator<.

#ifndef MAPCORE_KEY_TRAITS_HPP
#define MAPCORE_KEY_TRAITS_HPP

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

namespace mapcore
{

    /*-------------------------------------------------------------------------
     *  is_absent(key)
     *-------------------------------------------------------------------------
     *  A key is "absent" when it is a null pointer or an empty optional.
     *  Every other key type is always present.  Overload for your own
     *  nullable handle types in their namespace; calls go through ADL.
     *-------------------------------------------------------------------------*/
    template <typename K>
    constexpr bool is_absent(const K &) noexcept { return false; }

    template <typename T>
    constexpr bool is_absent(T *const &p) noexcept { return p == nullptr; }

    template <typename T>
    constexpr bool is_absent(const std::optional<T> &o) noexcept { return !o.has_value(); }

    template <typename T>
    bool is_absent(const std::shared_ptr<T> &p) noexcept { return p == nullptr; }

    template <typename T, typename D>
    bool is_absent(const std::unique_ptr<T, D> &p) noexcept { return p == nullptr; }

    namespace detail
    {
        template <typename K>
        bool key_absent(const K &k) noexcept
        {
            using mapcore::is_absent;
            return is_absent(k);
        }
    } // namespace detail

    /*-------------------------------------------------------------------------
     *  NaturalOrder<K>
     *-------------------------------------------------------------------------
     *  Default ordering of TreeMap: the key's own operator< (through
     *  std::less so raw pointers compare totally).  Natural ordering has
     *  no place for an absent key, so TreeMap rejects those up front.
     *-------------------------------------------------------------------------*/
    template <typename K>
    struct NaturalOrder
    {
        bool operator()(const K &a, const K &b) const { return std::less<K>{}(a, b); }
    };

    /* Whether a comparator is prepared to order absent keys.  Only the
       natural ordering refuses them; a user comparator is trusted. */
    template <typename Compare>
    struct permits_absent_keys : std::true_type
    {
    };

    template <typename K>
    struct permits_absent_keys<NaturalOrder<K>> : std::false_type
    {
    };

    /* has_less<K>: `a < b` is well-formed and yields something bool-like.
       Tree-form hash buckets use it as a secondary ordering after the
       fingerprint. */
    template <typename K, typename = void>
    struct has_less : std::false_type
    {
    };

    template <typename K>
    struct has_less<K, std::void_t<decltype(static_cast<bool>(std::declval<const K &>() < std::declval<const K &>()))>>
        : std::true_type
    {
    };

} // namespace mapcore

#endif // MAPCORE_KEY_TRAITS_HPP
