// sequence_test.cpp
// Functional tests for mapcore::ArrayList and mapcore::LinkedList
// -------------------------------------------------------------------
// Build: g++ -std=c++17 -Iinclude sequence_test.cpp -o sequence_test

#include <cassert>
#include <string>
#include <vector>

#include "mapcore/array_list.hpp"
#include "mapcore/linked_list.hpp"
#include "mapcore/log.hpp"

using mapcore::ArrayList;
using mapcore::LinkedList;
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

template <typename List>
static std::vector<typename List::value_type> items_of(const List &l)
{
    return std::vector<typename List::value_type>(l.begin(), l.end());
}

using Ints = std::vector<int>;

// ── ArrayList ───────────────────────────────────────────────────────────
static void test_array_list_growth()
{
    ArrayList<int> lazy;
    assert(lazy.capacity() == 0);
    lazy.reserve(5); // within the default, left to the first add
    assert(lazy.capacity() == 0);
    lazy.add(1);
    assert(lazy.capacity() == 10);
    for (int i = 2; i <= 11; ++i)
        lazy.add(i);
    assert(lazy.capacity() == 15);
    for (int i = 12; i <= 16; ++i)
        lazy.add(i);
    assert(lazy.capacity() == 22);
    assert(lazy.size() == 16);

    ArrayList<int> zero(0);
    zero.add(1);
    assert(zero.capacity() == 1);
    zero.add(2);
    assert(zero.capacity() == 2);
    zero.add(3);
    assert(zero.capacity() == 3);

    ArrayList<int> reserved;
    reserved.reserve(40);
    assert(reserved.capacity() == 40);
    reserved.reserve(41);
    assert(reserved.capacity() == 60);

    assert(throws<mapcore::InvalidArgument>([] { ArrayList<int> bad(-1); }));

    util::println("  ✔ ArrayList growth: 10, 15, 22 and explicit reserve");
}

static void test_array_list_access()
{
    ArrayList<std::string> list;
    list.add("b");
    list.add("d");
    list.insert(0, "a");
    list.insert(2, "c");
    list.insert(4, "e");
    assert((items_of(list) == std::vector<std::string>{"a", "b", "c", "d", "e"}));

    assert(list.set(1, "B") == "b");
    assert(list.get(1) == "B");
    assert(*list.index_of("c") == 2);
    assert(!list.index_of("z"));
    assert(list.contains("e"));

    assert(list.remove_at(0) == "a");
    assert(list.remove("d"));
    assert(!list.remove("d"));
    assert((items_of(list) == std::vector<std::string>{"B", "c", "e"}));

    const auto mods = list.mod_count();
    assert(throws<mapcore::IndexOutOfRange>([&] { list.get(3); }));
    assert(throws<mapcore::IndexOutOfRange>([&] { list.set(3, "x"); }));
    assert(throws<mapcore::IndexOutOfRange>([&] { list.insert(4, "x"); }));
    assert(throws<mapcore::IndexOutOfRange>([&] { list.remove_at(7); }));
    assert(list.size() == 3 && list.mod_count() == mods);

    list.set(0, "b"); // set is not structural
    assert(list.mod_count() == mods);

    const auto cap = list.capacity();
    list.clear();
    assert(list.empty() && list.capacity() == cap);

    util::println("  ✔ ArrayList positional access and range checks");
}

// ── LinkedList ──────────────────────────────────────────────────────────
static void test_linked_list_access()
{
    LinkedList<int> list;
    assert(throws<mapcore::NoSuchElement>([&] { list.first(); }));
    assert(throws<mapcore::NoSuchElement>([&] { list.last(); }));

    for (int i = 0; i < 10; ++i)
        list.add(i);
    list.add_first(-1);
    list.insert(5, 100);
    list.insert(list.size(), 200);
    assert((items_of(list) == Ints{-1, 0, 1, 2, 3, 100, 4, 5, 6, 7, 8, 9, 200}));

    // both halves of the nearer-end walk
    assert(list.get(1) == 0);
    assert(list.get(11) == 9);
    assert(list.set(12, 201) == 200);
    assert(list.first() == -1 && list.last() == 201);

    assert(list.remove_at(5) == 100);
    assert(list.remove(-1));
    assert(!list.remove(-1));
    assert(*list.index_of(9) == 9);
    assert(list.contains(201));

    const auto mods = list.mod_count();
    assert(throws<mapcore::IndexOutOfRange>([&] { list.get(list.size()); }));
    assert(throws<mapcore::IndexOutOfRange>([&] { list.insert(list.size() + 1, 0); }));
    assert(list.mod_count() == mods);

    list.clear();
    assert(list.empty() && list.begin() == list.end());

    util::println("  ✔ LinkedList positional access from both ends");
}

// ── cursors, shared contract ────────────────────────────────────────────
template <typename List>
static void check_cursor_contract(const char *name)
{
    List list;
    for (int i = 0; i < 10; ++i)
        list.add(i);

    // forward pass: drop evens, double odds
    auto c = list.cursor();
    assert(!c.has_previous() && c.previous_index() == -1);
    assert(throws<mapcore::IllegalState>([&] { c.remove(); }));
    while (c.has_next())
    {
        int v = c.next();
        if (v % 2 == 0)
            c.remove();
        else
            c.set(v * 2);
    }
    assert((items_of(list) == Ints{2, 6, 10, 14, 18}));
    assert(throws<mapcore::NoSuchElement>([&] { c.next(); }));

    // backward pass with inserts
    assert(c.next_index() == 5);
    assert(c.previous() == 18);
    c.add(17); // goes in before 18; next() still yields 18
    assert(c.next() == 18);
    assert((items_of(list) == Ints{2, 6, 10, 14, 17, 18}));

    auto mid = list.cursor(3);
    assert(mid.next_index() == 3 && mid.previous_index() == 2);
    assert(mid.previous() == 10);
    mid.remove();
    assert(mid.next() == 14);
    assert((items_of(list) == Ints{2, 6, 14, 17, 18}));

    mid.add(15);
    assert(throws<mapcore::IllegalState>([&] { mid.set(0); }));

    auto front = list.cursor();
    assert(throws<mapcore::NoSuchElement>([&] { front.previous(); }));

    // fail-fast: a change through another path invalidates the cursor
    auto stale = list.cursor();
    list.add(99);
    assert(throws<mapcore::ConcurrentModification>([&] { stale.next(); }));

    assert(throws<mapcore::IndexOutOfRange>([&] { list.cursor(list.size() + 1); }));

    util::println("  ✔ {} cursor: next/previous/remove/set/add, fail-fast", name);
}

int main()
{
    util::println("==== Sequence tests ====");
    mapcore::init_log_from_env();

    test_array_list_growth();
    test_array_list_access();
    test_linked_list_access();
    check_cursor_contract<ArrayList<int>>("ArrayList");
    check_cursor_contract<LinkedList<int>>("LinkedList");

    util::println("🎉 ALL SEQUENCE TESTS PASSED");
    return 0;
}
