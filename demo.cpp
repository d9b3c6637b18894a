#include "mapcore/hash_map.hpp"
#include "mapcore/linked_hash_map.hpp"
#include "mapcore/log.hpp"
#include "mapcore/tree_map.hpp"

#include <cassert>
#include <string>

namespace util = mapcore::util;

// Hashes are multiples of 64: a 64-bucket table piles the keys into bucket 0.
struct Colliding
{
    std::size_t operator()(int k) const noexcept { return static_cast<std::size_t>(k) << 6; }
};

int main()
{
    // structural events (growth, treeify, split, eviction) show at debug
    mapcore::set_log_level(mapcore::LogLevel::Debug);
    mapcore::init_log_from_env();

    // ── 1. ordered map ───────────────────────────────────────────────────
    mapcore::TreeMap<int, std::string> tree;
    for (int k : {10, 85, 15, 70, 20, 60, 30, 50})
        tree.put(k, "#" + std::to_string(k));
    assert(tree.validate());

    std::string line;
    for (const auto &n : tree)
        line += std::to_string(n.key) + " ";
    util::println("[tree] in order: {}", line);
    util::println("[tree] floor(55) = {}, ceiling(55) = {}",
                  tree.floor(55)->key, tree.ceiling(55)->key);

    // ── 2. hash map: resize, then a tree-form bucket ─────────────────────
    mapcore::HashMap<int, int, Colliding> map(64);
    for (int k = 0; k < 9; ++k)
        map.put(k, k * k);
    util::println("[hash] bucket 0 is a {} of {} entries",
                  map.bucket_kind(0) == mapcore::BinKind::Tree ? "tree" : "list",
                  map.bucket_size(0));

    for (int k = 1000; k < 1060; ++k)
        map.put(k, k);
    util::println("[hash] {} entries in {} buckets (threshold {})",
                  map.size(), map.capacity(), map.threshold());
    assert(map.validate());

    // ── 3. LRU cache ─────────────────────────────────────────────────────
    mapcore::LinkedHashMap<std::string, int> lru(4, 0.75f, true);
    lru.set_eviction_predicate([](const std::string &, const int &, std::size_t size)
                               { return size > 3; });

    for (const char *name : {"alpha", "beta", "gamma"})
        lru.put(name, static_cast<int>(std::string(name).size()));
    lru.get("alpha"); // alpha becomes most recent
    lru.put("delta", 5);  // evicts beta

    line.clear();
    for (const auto &n : lru)
        line += n.key + " ";
    util::println("[lru] eldest first: {}", line);
    assert(!lru.contains("beta"));

    util::println("🎉 demo finished");
    return 0;
}
