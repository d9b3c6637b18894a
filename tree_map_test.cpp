// tree_map_test.cpp
// Functional tests for mapcore::TreeMap
// -------------------------------------------------------------------
// Build: g++ -std=c++17 -Iinclude tree_map_test.cpp -o tree_map_test

#include <cassert>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "mapcore/log.hpp"
#include "mapcore/tree_map.hpp"

using mapcore::TreeMap;
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
static std::vector<int> keys_of(const Map &m)
{
    std::vector<int> out;
    for (const auto &n : m)
        out.push_back(n.key);
    return out;
}

// ── 1. fixed insertion sequence ─────────────────────────────────────────
static void test_insertion_scenario()
{
    TreeMap<int, std::string> tree;
    for (int k : {10, 85, 15, 70, 20, 60, 30, 50})
    {
        assert(!tree.put(k, "v" + std::to_string(k)));
        assert(tree.validate());
    }

    assert(tree.size() == 8);
    assert((keys_of(tree) == std::vector<int>{10, 15, 20, 30, 50, 60, 70, 85}));
    assert(tree.first().key == 10);
    assert(tree.last().key == 85);
    assert(*tree.get(70) == "v70");
    assert(!tree.get(11));

    util::println("  ✔ insertion scenario: {} keys in ascending order", tree.size());
}

// ── 2. overwrite is not structural ──────────────────────────────────────
static void test_overwrite()
{
    TreeMap<int, int> tree;
    tree.put(1, 100);
    tree.put(2, 200);
    const auto mods = tree.mod_count();

    auto old = tree.put(1, 111);
    assert(old && *old == 100);
    assert(tree.size() == 2);
    assert(tree.mod_count() == mods);
    assert(*tree.get(1) == 111);

    auto kept = tree.put_if_absent(2, 999);
    assert(kept && *kept == 200);
    assert(*tree.get(2) == 200);
    assert(!tree.put_if_absent(3, 300));
    assert(tree.size() == 3);

    util::println("  ✔ overwrite returns previous value, counter untouched");
}

// ── 3. removal shapes ───────────────────────────────────────────────────
static void test_remove()
{
    TreeMap<int, int> tree;
    for (int k = 1; k <= 31; ++k)
        tree.put(k, k * 10);

    assert(!tree.remove(1000));
    assert(tree.size() == 31);

    // root (two children), an inner node, a leaf
    for (int k : {16, 8, 31, 1, 24})
    {
        auto v = tree.remove(k);
        assert(v && *v == k * 10);
        assert(!tree.contains(k));
        assert(tree.validate());
    }
    assert(tree.size() == 26);

    for (int k = 1; k <= 31; ++k)
        tree.remove(k);
    assert(tree.empty());
    assert(tree.validate());
    assert(tree.begin() == tree.end());

    util::println("  ✔ remove keeps invariants down to an empty tree");
}

// ── 4. randomised against std::map ──────────────────────────────────────
static void test_against_reference()
{
    constexpr int OPS = 20'000;
    constexpr int KEY_RANGE = 2'000;

    TreeMap<int, int> tree;
    std::map<int, int> reference;
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> key_dist(0, KEY_RANGE - 1);
    std::uniform_int_distribution<int> op_dist(0, 2);

    for (int i = 0; i < OPS; ++i)
    {
        int k = key_dist(rng);
        switch (op_dist(rng))
        {
        case 0:
        case 1:
        {
            auto old = tree.put(k, i);
            auto it = reference.find(k);
            assert(old.has_value() == (it != reference.end()));
            if (old)
                assert(*old == it->second);
            reference[k] = i;
            break;
        }
        default:
        {
            auto old = tree.remove(k);
            assert(old.has_value() == (reference.erase(k) == 1));
            break;
        }
        }

        if (i % 97 == 0)
            assert(tree.validate());
    }

    assert(tree.validate());
    assert(tree.size() == reference.size());

    auto it = reference.begin();
    for (const auto &n : tree)
    {
        assert(n.key == it->first && n.val == it->second);
        ++it;
    }
    assert(it == reference.end());

    util::println("  ✔ {} random ops agree with std::map ({} keys left)", OPS, tree.size());
}

// ── 5. floor / ceiling / first / last ───────────────────────────────────
static void test_navigation()
{
    TreeMap<int, int> tree;
    assert(throws<mapcore::NoSuchElement>([&] { tree.first(); }));
    assert(throws<mapcore::NoSuchElement>([&] { tree.last(); }));

    for (int k : {10, 20, 30, 40})
        tree.put(k, k);

    assert(tree.floor(25)->key == 20);
    assert(tree.ceiling(25)->key == 30);
    assert(tree.floor(20)->key == 20);
    assert(tree.ceiling(40)->key == 40);
    assert(tree.floor(5) == nullptr);
    assert(tree.ceiling(41) == nullptr);

    const auto *n = &tree.first();
    int steps = 0;
    while (n != nullptr)
    {
        n = TreeMap<int, int>::successor(n);
        ++steps;
    }
    assert(steps == 4);

    util::println("  ✔ floor/ceiling/first/last");
}

// ── 6. absent keys and refusing comparators ─────────────────────────────
struct NonEmptyOnly
{
    bool operator()(const std::string &a, const std::string &b) const
    {
        if (a.empty() || b.empty())
            throw mapcore::InvalidKey("empty key cannot be ordered");
        return a < b;
    }
};

static void test_invalid_keys()
{
    TreeMap<std::optional<int>, int> natural;
    assert(throws<mapcore::InvalidKey>([&] { natural.put(std::nullopt, 1); }));
    assert(throws<mapcore::InvalidKey>([&] { natural.get(std::nullopt); }));
    assert(throws<mapcore::InvalidKey>([&] { natural.remove(std::nullopt); }));
    assert(natural.empty());
    natural.put(3, 3);
    assert(throws<std::invalid_argument>([&] { natural.put(std::nullopt, 1); }));
    assert(natural.size() == 1 && natural.validate());

    // a user comparator is trusted with absent keys
    TreeMap<std::optional<int>, int, std::less<std::optional<int>>> tolerant;
    tolerant.put(std::nullopt, 0);
    tolerant.put(5, 5);
    assert(tolerant.size() == 2);
    assert(!tolerant.first().key.has_value());

    // a comparator that rejects a key leaves the tree untouched
    TreeMap<std::string, int, NonEmptyOnly> picky;
    assert(throws<mapcore::InvalidKey>([&] { picky.put("", 1); }));
    assert(picky.empty() && picky.mod_count() == 0);
    picky.put("b", 2);
    picky.put("a", 1);
    const auto mods = picky.mod_count();
    assert(throws<mapcore::InvalidKey>([&] { picky.put("", 3); }));
    assert(picky.size() == 2 && picky.mod_count() == mods);
    assert(picky.validate());

    util::println("  ✔ invalid keys rejected without side effects");
}

// ── 7. fail-fast iteration ──────────────────────────────────────────────
static void test_fail_fast()
{
    TreeMap<int, int> tree;
    for (int k = 0; k < 10; ++k)
        tree.put(k, k);

    auto it = tree.begin();
    tree.put(3, 33); // value only
    assert(it->key == 0);
    ++it;

    tree.put(100, 100);
    assert(throws<mapcore::ConcurrentModification>([&] { ++it; }));
    assert(throws<mapcore::ConcurrentModification>([&] { (void)*it; }));

    auto fresh = tree.begin();
    tree.remove(5);
    assert(throws<mapcore::ConcurrentModification>([&] { (void)*fresh; }));

    auto end = tree.end();
    assert(throws<mapcore::NoSuchElement>([&] { ++end; }));

    util::println("  ✔ iterators fail fast on structural change");
}

// ── 8. move hands the tree over ─────────────────────────────────────────
static void test_move()
{
    TreeMap<int, int> a;
    for (int k = 0; k < 100; ++k)
        a.put(k, -k);

    TreeMap<int, int> b(std::move(a));
    assert(b.size() == 100 && b.validate());
    assert(a.empty() && a.validate());

    TreeMap<int, int> c;
    c.put(1, 1);
    c = std::move(b);
    assert(c.size() == 100 && *c.get(99) == -99);
    assert(b.empty());

    util::println("  ✔ move construction and assignment");
}

int main()
{
    util::println("==== TreeMap tests ====");
    mapcore::init_log_from_env();

    test_insertion_scenario();
    test_overwrite();
    test_remove();
    test_against_reference();
    test_navigation();
    test_invalid_keys();
    test_fail_fast();
    test_move();

    util::println("🎉 ALL TREEMAP TESTS PASSED");
    return 0;
}
