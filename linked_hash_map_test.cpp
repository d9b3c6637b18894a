// linked_hash_map_test.cpp
// Functional tests for mapcore::LinkedHashMap: insertion order, access
// order, and predicate-driven eviction (LRU caching).
// -------------------------------------------------------------------
// Build: g++ -std=c++17 -Iinclude linked_hash_map_test.cpp -o linked_hash_map_test

#include <cassert>
#include <string>
#include <vector>

#include "mapcore/linked_hash_map.hpp"
#include "mapcore/log.hpp"

using mapcore::BinKind;
using mapcore::LinkedHashMap;
namespace util = mapcore::util;

template <typename E, typename Fn>
static bool throws(Fn &&fn)
{
    try
    {
        fn();
    }
    catch (const E &)
    {
        return true;
    }
    return false;
}

template <typename Map>
static auto keys_of(const Map &m)
{
    std::vector<typename Map::key_type> out;
    for (const auto &n : m)
        out.push_back(n.key);
    return out;
}

using Names = std::vector<std::string>;

// ── 1. insertion order ──────────────────────────────────────────────────
static void test_insertion_order()
{
    LinkedHashMap<std::string, int> map;
    assert(!map.access_order());
    map.put("A", 1);
    map.put("B", 2);
    map.put("C", 3);
    map.put("A", 10); // re-put keeps its place
    assert((keys_of(map) == Names{"A", "B", "C"}));

    assert(*map.get("A") == 10);
    assert((keys_of(map) == Names{"A", "B", "C"}));

    map.remove("B");
    assert((keys_of(map) == Names{"A", "C"}));
    map.put("B", 20);
    assert((keys_of(map) == Names{"A", "C", "B"}));
    assert(map.eldest()->key == "A");
    assert(map.youngest()->key == "B");
    assert(map.validate());

    util::println("  ✔ insertion order survives overwrite and re-insert");
}

// ── 2. the LRU scenario ─────────────────────────────────────────────────
static void test_lru_scenario()
{
    LinkedHashMap<std::string, int> lru(2, 0.75f, true);
    assert(lru.access_order());
    lru.set_eviction_predicate([](const std::string &, const int &, std::size_t size)
                               { return size > 2; });

    lru.put("A", 1);
    lru.put("B", 2);
    lru.put("C", 3);
    assert(!lru.contains("A"));
    assert((keys_of(lru) == Names{"B", "C"}));

    assert(*lru.get("B") == 2);
    assert((keys_of(lru) == Names{"C", "B"}));

    lru.put("D", 4);
    assert(!lru.contains("C"));
    assert((keys_of(lru) == Names{"B", "D"}));
    assert(lru.size() == 2);
    assert(lru.validate());

    util::println("  ✔ LRU: A B C → [B, C]; get B → [C, B]; put D → [B, D]");
}

// ── 3. access order details ─────────────────────────────────────────────
static void test_access_order()
{
    LinkedHashMap<int, int> map(16, 0.75f, true);
    for (int k = 1; k <= 4; ++k)
        map.put(k, k);

    map.put(2, 20); // put of an existing key is an access
    assert((keys_of(map) == std::vector<int>{1, 3, 4, 2}));

    assert(map.contains(1)); // membership is not
    assert((keys_of(map) == std::vector<int>{1, 3, 4, 2}));

    assert(map.get_or_default(3, -1) == 3);
    assert((keys_of(map) == std::vector<int>{1, 4, 2, 3}));
    assert(map.get_or_default(99, -1) == -1);

    // touching the youngest entry changes nothing
    const auto mods = map.mod_count();
    map.get(3);
    assert(map.mod_count() == mods);

    // any other access reorders and counts as a structural change
    auto it = map.begin();
    map.get(1);
    assert(map.mod_count() == mods + 1);
    assert(throws<mapcore::ConcurrentModification>([&] { (void)*it; }));
    assert(map.eldest()->key == 4);
    assert(map.youngest()->key == 1);

    // in insertion-order mode a get never invalidates iterators
    LinkedHashMap<int, int> plain;
    plain.put(1, 1);
    plain.put(2, 2);
    auto pit = plain.begin();
    plain.get(1);
    assert(pit->key == 1);

    util::println("  ✔ access order moves touched entries to the young end");
}

// ── 4. eviction predicate sees the eldest entry ─────────────────────────
static void test_predicate_arguments()
{
    LinkedHashMap<int, std::string> map;
    std::vector<int> offered;
    std::vector<std::size_t> sizes;
    map.set_eviction_predicate([&](const int &k, const std::string &v, std::size_t size)
                               {
        offered.push_back(k);
        sizes.push_back(size);
        return v == "drop"; });

    map.put(1, "keep");
    map.put(2, "two");
    assert((offered == std::vector<int>{1, 1}));
    assert((sizes == std::vector<std::size_t>{1, 2}));

    map.put(1, "drop"); // overwrite: no insert, no eviction check
    assert(offered.size() == 2);

    map.put(3, "three");
    assert(!map.contains(1));
    assert((keys_of(map) == std::vector<int>{2, 3}));

    map.set_eviction_predicate(nullptr);
    map.put(4, "drop");
    assert(map.size() == 3);

    util::println("  ✔ predicate receives eldest key, value and new size");
}

// ── 5. overlay survives treeify and resize ──────────────────────────────
struct Clustered
{
    std::size_t operator()(int k) const noexcept { return static_cast<std::size_t>(k % 4) << 6; }
};

static void test_order_across_restructuring()
{
    mapcore::HashOptions opts;
    opts.initial_capacity = 64;
    LinkedHashMap<int, int, Clustered> map(opts);

    std::vector<int> expected;
    for (int k = 0; k < 120; ++k)
    {
        map.put(k, k);
        expected.push_back(k);
    }
    assert(map.engine().capacity() == 256);
    assert(map.engine().bucket_kind(0) == BinKind::Tree);
    assert(keys_of(map) == expected);
    assert(map.validate());

    // remove from the middle of a tree bucket
    for (int k = 0; k < 120; k += 3)
        map.remove(k);
    expected.clear();
    for (int k = 0; k < 120; ++k)
        if (k % 3 != 0)
            expected.push_back(k);
    assert(keys_of(map) == expected);
    assert(map.validate());

    map.clear();
    assert(map.empty());
    assert(map.eldest() == nullptr && map.youngest() == nullptr);
    assert(map.begin() == map.end());
    map.put(7, 7);
    assert(map.eldest() == map.youngest());
    assert(map.validate());

    util::println("  ✔ order intact across treeify, resize, removal and clear");
}

// ── 6. constructor contract is shared with HashMap ──────────────────────
static void test_constructor_contract()
{
    assert(throws<mapcore::InvalidArgument>([] { LinkedHashMap<int, int> m(-3, 0.75f, true); }));
    assert(throws<mapcore::InvalidArgument>([] { LinkedHashMap<int, int> m(8, 0.0f); }));

    LinkedHashMap<int, int> ok(0, 1.5f, true);
    ok.put(1, 1);
    assert(ok.size() == 1 && ok.validate());

    util::println("  ✔ invalid capacity / load factor rejected");
}

int main()
{
    util::println("==== LinkedHashMap tests ====");
    mapcore::init_log_from_env();

    test_insertion_order();
    test_lru_scenario();
    test_access_order();
    test_predicate_arguments();
    test_order_across_restructuring();
    test_constructor_contract();

    util::println("🎉 ALL LINKEDHASHMAP TESTS PASSED");
    return 0;
}
