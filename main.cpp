
// -----------------------------
// Examples (compile-time guard)
// -----------------------------
// Define AVL_TREE_MAP_EXAMPLE_MAIN to compile and run examples of AVLTreeMap behavior.
//
// Example 1: ascending inserts stay balanced (a plain BST would degrade to a list).
// Example 2: overwrite, two-child removal and a range scan starting mid-tree.
// Example 3: a three-way comparator adapted with three_way_less.
// The CMake target avl_tree_map_example defines the macro.

#ifdef AVL_TREE_MAP_EXAMPLE_MAIN
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "avl_tree_map.hpp"

namespace {

key_ordering compare_ignoring_case(const std::string& a, const std::string& b) {
    size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        int ca = std::tolower(static_cast<unsigned char>(a[i]));
        int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb ? key_ordering::less : key_ordering::greater;
    }
    if (a.size() == b.size()) return key_ordering::equal;
    return a.size() < b.size() ? key_ordering::less : key_ordering::greater;
}

} // namespace

int main() {
    using Map = AVLTreeMap<int, std::string>;
    {
        std::cout << "Example 1: insert 1..7 in ascending order\n";
        Map m;
        for (int i = 1; i <= 7; ++i) m.put(i, "v" + std::to_string(i));
        std::cout << "size=" << m.size() << " height=" << m.height()
                  << " rotations=" << m.rotation_count() << "\n";
        m.tree_dump(std::cout);
    }

    {
        std::cout << "\nExample 2: overwrite, remove with two children, iterate_from\n";
        Map m{{5, "five"}, {3, "three"}, {8, "eight"}, {1, "one"}, {4, "four"}, {7, "seven"}, {9, "nine"}};
        auto old = m.put(8, "EIGHT");
        std::cout << "put(8) replaced: " << old.value_or("<none>") << "\n";
        auto removed = m.remove(5);
        std::cout << "remove(5) returned: " << removed.value_or("<none>") << "\n";
        std::cout << "remove(42) returned: " << m.remove(42).value_or("<none>") << "\n";
        std::cout << "keys >= 4:";
        for (const auto& kv : m.iterate_from(4)) std::cout << " " << kv.first << "=" << kv.second;
        std::cout << "\n";
        std::string diag;
        std::cout << "invariants hold? " << (m.validate_invariants(&diag) ? "yes" : "no") << "\n";
        if (auto lo = m.min()) std::cout << "min=" << lo->first << " ";
        if (auto hi = m.max()) std::cout << "max=" << hi->first << "\n";
    }

    {
        std::cout << "\nExample 3: case-insensitive keys through a three-way comparator\n";
        using Cmp = three_way_less<std::string, key_ordering (*)(const std::string&, const std::string&)>;
        AVLTreeMap<std::string, int, Cmp> words{Cmp(&compare_ignoring_case)};
        words.put("Apple", 1);
        words.put("banana", 2);
        auto prev = words.put("APPLE", 3);
        std::cout << "size=" << words.size() << " previous apple=" << (prev ? *prev : -1) << "\n";
        for (const auto& kv : words) std::cout << kv.first << " -> " << kv.second << "\n";
    }

    return 0;
}
#endif
