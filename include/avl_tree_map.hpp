// avl_tree_map.hpp
// AVL tree map: height-balanced ordered map with unique keys and allocator-aware nodes.
//
// - C++17 header-only.
// - Nodes carry no parent pointer. Insert and remove descend iteratively and record the
//   visited link slots on an explicit path stack, then walk that path back to the root
//   refreshing heights and applying LL / LR / RR / RL rotations where |balance| > 1.
// - Iterators are forward-only and keep an explicit stack of pending ancestors, so stepping
//   never needs a parent link. lower_bound / iterate_from seed that stack with a pruned descent.
// - Any structural change (new key, removal, clear, assignment, swap) invalidates every
//   outstanding iterator. Using one afterwards is a precondition violation; debug builds
//   catch it with an assertion on the container's modification stamp.
// - Diagnostics:
//     * validate_invariants_json(std::string& out_json) const
//         - Checks BST order, stored heights, balance factors and size.
//         - Emits a JSON object with validity, issues, height, rotation count and a node list.
//     * validate_invariants(std::string* out) const
//         - Human-readable wrapper (JSON plus tree dump).
//     * tree_dump(std::ostream& os, bool show_addresses = false) const
// - Define AVL_TREE_MAP_VALIDATE_ON_MUTATION to run the validator after every mutation
//   and assert on failure. Validation and dumps assume Key is streamable (operator<<).
//
// Usage:
//   AVLTreeMap<int, std::string> m;
//   m.put(3, "three");                     // std::nullopt, new key
//   auto old = m.put(3, "THREE");          // old == "three"
//   auto v = m.get(3);                     // v == "THREE"
//   for (const auto& kv : m.iterate_from(2)) { ... }
//   m.remove(3);                           // "THREE"

#ifndef AVL_TREE_MAP_HPP
#define AVL_TREE_MAP_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

// Result of a three-way key comparison.
enum class key_ordering : signed char { less = -1, equal = 0, greater = 1 };

// Adapts a three-way comparator (K, K) -> key_ordering to the strict "less" functor
// AVLTreeMap is parameterised on. The function must describe a total order.
template <typename Key, typename ThreeWay>
class three_way_less {
public:
    explicit three_way_less(ThreeWay fn = ThreeWay()) : fn_(std::move(fn)) {}

    bool operator()(const Key& a, const Key& b) const {
        return fn_(a, b) == key_ordering::less;
    }

private:
    ThreeWay fn_;
};

template <
    typename Key,
    typename T,
    typename Compare = std::less<Key>,
    typename Alloc = std::allocator<std::pair<const Key, T>>
>
class AVLTreeMap {
public:
    using key_type        = Key;
    using mapped_type     = T;
    using value_type      = std::pair<const Key, T>;
    using key_compare     = Compare;
    using allocator_type  = Alloc;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

private:
    struct Node {
        value_type value;
        Node* left;
        Node* right;
        int height;

        template <typename... Args>
        explicit Node(Args&&... args)
            : value(std::forward<Args>(args)...), left(nullptr), right(nullptr), height(1) {}
    };

    using AllocTraits = std::allocator_traits<allocator_type>;
    using NodeAlloc = typename AllocTraits::template rebind_alloc<Node>;
    using NodeAllocTraits = std::allocator_traits<NodeAlloc>;

    // An AVL tree of height h holds at least F(h + 2) - 1 nodes, so no tree addressable
    // with a 64-bit size_type is taller than 91. One slot per level plus the nil slot.
    static constexpr std::size_t max_path_length = 96;

    // Link slots visited by a descent, root slot first.
    struct descent_path {
        std::array<Node**, max_path_length> slots;
        std::size_t depth = 0;

        void push(Node** slot) noexcept {
            assert(depth < slots.size());
            slots[depth++] = slot;
        }
    };

public:
    class const_iterator;
    class iterator {
        friend class AVLTreeMap;
        friend class const_iterator;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = AVLTreeMap::value_type;
        using reference         = value_type&;
        using pointer           = value_type*;
        using difference_type   = AVLTreeMap::difference_type;

        iterator() noexcept : tree_(nullptr), stamp_(0) {}

        reference operator*() const { check(); return stack_.back()->value; }
        pointer operator->() const { check(); return &stack_.back()->value; }

        iterator& operator++() { check(); AVLTreeMap::advance(stack_); return *this; }
        iterator operator++(int) { iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const iterator& o) const { return AVLTreeMap::same_position(stack_, o.stack_); }
        bool operator!=(const iterator& o) const { return !(*this == o); }

    private:
        std::vector<Node*> stack_;
        const AVLTreeMap* tree_;
        std::size_t stamp_;

        iterator(std::vector<Node*> stack, const AVLTreeMap* t) noexcept
            : stack_(std::move(stack)), tree_(t), stamp_(t->stamp_) {}

        void check() const {
            assert(!stack_.empty() && "dereferencing or advancing end()");
            assert(tree_ && stamp_ == tree_->stamp_ && "iterator invalidated by a structural change");
        }
    };

    class const_iterator {
        friend class AVLTreeMap;
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type        = AVLTreeMap::value_type;
        using reference         = const value_type&;
        using pointer           = const value_type*;
        using difference_type   = AVLTreeMap::difference_type;

        const_iterator() noexcept : tree_(nullptr), stamp_(0) {}
        const_iterator(const iterator& it)
            : stack_(it.stack_), tree_(it.tree_), stamp_(it.stamp_) {}

        reference operator*() const { check(); return stack_.back()->value; }
        pointer operator->() const { check(); return &stack_.back()->value; }

        const_iterator& operator++() { check(); AVLTreeMap::advance(stack_); return *this; }
        const_iterator operator++(int) { const_iterator tmp = *this; ++(*this); return tmp; }

        bool operator==(const const_iterator& o) const { return AVLTreeMap::same_position(stack_, o.stack_); }
        bool operator!=(const const_iterator& o) const { return !(*this == o); }

    private:
        std::vector<Node*> stack_;
        const AVLTreeMap* tree_;
        std::size_t stamp_;

        const_iterator(std::vector<Node*> stack, const AVLTreeMap* t) noexcept
            : stack_(std::move(stack)), tree_(t), stamp_(t->stamp_) {}

        void check() const {
            assert(!stack_.empty() && "dereferencing or advancing end()");
            assert(tree_ && stamp_ == tree_->stamp_ && "iterator invalidated by a structural change");
        }
    };

    // Lazy ascending sequence usable in range-for.
    class const_range {
    public:
        const_range(const_iterator first, const_iterator last)
            : first_(std::move(first)), last_(std::move(last)) {}
        const_iterator begin() const { return first_; }
        const_iterator end() const { return last_; }
    private:
        const_iterator first_;
        const_iterator last_;
    };

    // constructors / destructor / assignment
    explicit AVLTreeMap(const key_compare& comp = key_compare(), const allocator_type& alloc = allocator_type())
        : root_(nullptr), comp_(comp), node_alloc_(alloc), size_(0), rotation_count_(0), stamp_(0) {}

    explicit AVLTreeMap(const allocator_type& alloc)
        : AVLTreeMap(key_compare(), alloc) {}

    AVLTreeMap(std::initializer_list<value_type> init,
               const key_compare& comp = key_compare(), const allocator_type& alloc = allocator_type())
        : AVLTreeMap(comp, alloc)
    {
        insert(init.begin(), init.end());
    }

    AVLTreeMap(const AVLTreeMap& other)
        : root_(nullptr), comp_(other.comp_),
          node_alloc_(NodeAllocTraits::select_on_container_copy_construction(other.node_alloc_)),
          size_(0), rotation_count_(0), stamp_(0)
    {
        root_ = clone_nodes(other.root_);
        size_ = other.size_;
    }

    AVLTreeMap(AVLTreeMap&& other) noexcept
        : root_(other.root_), comp_(std::move(other.comp_)), node_alloc_(std::move(other.node_alloc_)),
          size_(other.size_), rotation_count_(other.rotation_count_), stamp_(0)
    {
        other.root_ = nullptr;
        other.size_ = 0;
        other.rotation_count_ = 0;
        ++other.stamp_;
    }

    AVLTreeMap& operator=(const AVLTreeMap& other) {
        if (this != &other) {
            clear();
            using POCCA = typename NodeAllocTraits::propagate_on_container_copy_assignment;
            if constexpr (POCCA::value) node_alloc_ = other.node_alloc_;
            comp_ = other.comp_;
            root_ = clone_nodes(other.root_);
            size_ = other.size_;
        }
        return *this;
    }

    AVLTreeMap& operator=(AVLTreeMap&& other) noexcept(NodeAllocTraits::is_always_equal::value ||
                                                       NodeAllocTraits::propagate_on_container_move_assignment::value) {
        if (this == &other) return *this;

        using POCMA = typename NodeAllocTraits::propagate_on_container_move_assignment;
        if constexpr (POCMA::value) {
            clear();
            comp_ = std::move(other.comp_);
            node_alloc_ = std::move(other.node_alloc_);
            steal(other);
        } else {
            bool allocs_equal = NodeAllocTraits::is_always_equal::value || (node_alloc_ == other.node_alloc_);
            if (allocs_equal) {
                clear();
                comp_ = std::move(other.comp_);
                steal(other);
            } else {
                // allocators unequal and not propagated: move elements into our own nodes
                clear();
                comp_ = other.comp_;
                for (auto& kv : other) try_emplace(kv.first, std::move(kv.second));
                other.clear();
            }
        }
        return *this;
    }

    AVLTreeMap& operator=(std::initializer_list<value_type> init) {
        clear();
        insert(init.begin(), init.end());
        return *this;
    }

    ~AVLTreeMap() { clear_nodes(root_); }

    // capacity
    bool empty() const noexcept { return size_ == 0; }
    size_type size() const noexcept { return size_; }
    size_type max_size() const noexcept { return NodeAllocTraits::max_size(node_alloc_); }

    // Height of the whole tree; 0 when empty.
    size_type height() const noexcept { return static_cast<size_type>(node_height(root_)); }

    // iterators
    iterator begin() { return iterator(leftmost_stack(root_), this); }
    const_iterator begin() const { return const_iterator(leftmost_stack(root_), this); }
    const_iterator cbegin() const { return begin(); }

    iterator end() noexcept { return iterator(std::vector<Node*>(), this); }
    const_iterator end() const noexcept { return const_iterator(std::vector<Node*>(), this); }
    const_iterator cend() const noexcept { return end(); }

    const_range iterate() const { return const_range(begin(), end()); }

    // Ascending sequence starting at the first key not less than k.
    const_range iterate_from(const key_type& k) const { return const_range(lower_bound(k), end()); }

    // element access
    mapped_type& operator[](const key_type& k) { return try_emplace(k).first->second; }
    mapped_type& operator[](key_type&& k) { return try_emplace(std::move(k)).first->second; }

    mapped_type& at(const key_type& k) {
        Node* n = find_node(k);
        if (!n) throw std::out_of_range("AVLTreeMap::at: key not found");
        return n->value.second;
    }

    const mapped_type& at(const key_type& k) const {
        const Node* n = find_node(k);
        if (!n) throw std::out_of_range("AVLTreeMap::at: key not found");
        return n->value.second;
    }

    // Copy of the value stored under k, or std::nullopt.
    std::optional<mapped_type> get(const key_type& k) const {
        const Node* n = find_node(k);
        if (!n) return std::nullopt;
        return n->value.second;
    }

    std::optional<value_type> min() const {
        if (!root_) return std::nullopt;
        const Node* n = root_;
        while (n->left) n = n->left;
        return n->value;
    }

    std::optional<value_type> max() const {
        if (!root_) return std::nullopt;
        const Node* n = root_;
        while (n->right) n = n->right;
        return n->value;
    }

    // modifiers

    // Stores v under k. Returns the value it replaced, or std::nullopt when k is new.
    template <typename M>
    std::optional<mapped_type> put(const key_type& k, M&& v) {
        descent_path path;
        Node** slot = descend(k, path);
        if (Node* n = *slot) {
            // build the replacement before touching the stored value
            mapped_type replacement(std::forward<M>(v));
            using std::swap;
            swap(n->value.second, replacement);
            return std::optional<mapped_type>(std::move(replacement));
        }
        Node* z = allocate_node(std::piecewise_construct, std::forward_as_tuple(k),
                                std::forward_as_tuple(std::forward<M>(v)));
        link_new_node(slot, z, path);
        return std::nullopt;
    }

    // Removes k. Returns the value it held, or std::nullopt when absent (tree untouched).
    std::optional<mapped_type> remove(const key_type& k) {
        descent_path path;
        Node** slot = descend(k, path);
        Node* z = *slot;
        if (!z) return std::nullopt;
        std::optional<mapped_type> removed(std::move(z->value.second));
        unlink_node(slot, path);
        deallocate_node(z);
        check_after_mutation();
        return removed;
    }

    // insert overwrites the mapped value of an existing key; the bool is true when k was new.
    std::pair<iterator, bool> insert(const value_type& v) { return insert_value(v); }
    std::pair<iterator, bool> insert(value_type&& v) { return insert_value(std::move(v)); }

    template <typename InputIt>
    void insert(InputIt first, InputIt last) {
        for (; first != last; ++first) insert_value(*first);
    }

    void insert(std::initializer_list<value_type> init) { insert(init.begin(), init.end()); }

    template <typename... Args>
    std::pair<iterator, bool> emplace(Args&&... args) {
        value_type val(std::forward<Args>(args)...);
        return insert_value(std::move(val));
    }

    // Constructs the value in place only if k is absent; never overwrites.
    template <typename... Args>
    std::pair<iterator, bool> try_emplace(const key_type& k, Args&&... args) {
        descent_path path;
        Node** slot = descend(k, path);
        if (*slot) return { find(k), false };
        Node* z = allocate_node(std::piecewise_construct, std::forward_as_tuple(k),
                                std::forward_as_tuple(std::forward<Args>(args)...));
        link_new_node(slot, z, path);
        return { find(z->value.first), true };
    }

    template <typename... Args>
    std::pair<iterator, bool> try_emplace(key_type&& k, Args&&... args) {
        descent_path path;
        Node** slot = descend(k, path);
        if (*slot) return { find(k), false };
        Node* z = allocate_node(std::piecewise_construct, std::forward_as_tuple(std::move(k)),
                                std::forward_as_tuple(std::forward<Args>(args)...));
        link_new_node(slot, z, path);
        return { find(z->value.first), true };
    }

    template <typename M>
    std::pair<iterator, bool> insert_or_assign(const key_type& k, M&& obj) {
        descent_path path;
        Node** slot = descend(k, path);
        if (Node* n = *slot) {
            n->value.second = std::forward<M>(obj);
            return { find(k), false };
        }
        Node* z = allocate_node(std::piecewise_construct, std::forward_as_tuple(k),
                                std::forward_as_tuple(std::forward<M>(obj)));
        link_new_node(slot, z, path);
        return { find(z->value.first), true };
    }

    size_type erase(const key_type& k) { return remove(k) ? 1 : 0; }

    // Erases the element at pos and returns an iterator to the next key.
    iterator erase(const_iterator pos) {
        if (pos == cend()) return end();
        key_type k = pos->first;
        remove(k);
        return upper_bound(k);
    }

    void clear() noexcept {
        clear_nodes(root_);
        root_ = nullptr;
        size_ = 0;
        ++stamp_;
    }

    // swap respects propagate_on_container_swap semantics
    void swap(AVLTreeMap& other) {
        using POCS = typename NodeAllocTraits::propagate_on_container_swap;
        bool allocs_equal = NodeAllocTraits::is_always_equal::value || (node_alloc_ == other.node_alloc_);
        if (POCS::value || allocs_equal) {
            using std::swap;
            swap(root_, other.root_);
            swap(comp_, other.comp_);
            if constexpr (POCS::value) swap(node_alloc_, other.node_alloc_);
            swap(size_, other.size_);
            swap(rotation_count_, other.rotation_count_);
            ++stamp_;
            ++other.stamp_;
        } else {
            // allocators not equal and not allowed to propagate: swap by moving elements individually
            AVLTreeMap tmp(other.comp_, get_allocator());
            tmp = std::move(*this);
            *this = std::move(other);
            other = std::move(tmp);
        }
    }

    // lookup
    iterator find(const key_type& k) { return iterator(find_stack(k), this); }
    const_iterator find(const key_type& k) const { return const_iterator(find_stack(k), this); }

    bool contains(const key_type& k) const { return find_node(k) != nullptr; }
    size_type count(const key_type& k) const { return contains(k) ? 1 : 0; }

    // Seeds the stack with every ancestor >= k; subtrees entirely below k are pruned.
    iterator lower_bound(const key_type& k) { return iterator(bound_stack(k, false), this); }
    const_iterator lower_bound(const key_type& k) const { return const_iterator(bound_stack(k, false), this); }

    iterator upper_bound(const key_type& k) { return iterator(bound_stack(k, true), this); }
    const_iterator upper_bound(const key_type& k) const { return const_iterator(bound_stack(k, true), this); }

    std::pair<iterator, iterator> equal_range(const key_type& k) { return { lower_bound(k), upper_bound(k) }; }
    std::pair<const_iterator, const_iterator> equal_range(const key_type& k) const {
        return { lower_bound(k), upper_bound(k) };
    }

    // comparison accessor
    key_compare key_comp() const { return comp_; }

    struct value_compare {
    protected:
        key_compare comp_;
        explicit value_compare(key_compare c) : comp_(c) {}
    public:
        bool operator()(const value_type& a, const value_type& b) const {
            return comp_(a.first, b.first);
        }
        friend class AVLTreeMap;
    };

    value_compare value_comp() const { return value_compare(comp_); }

    allocator_type get_allocator() const { return allocator_type(node_alloc_); }

    friend bool operator==(const AVLTreeMap& a, const AVLTreeMap& b) {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
    }

    friend bool operator!=(const AVLTreeMap& a, const AVLTreeMap& b) { return !(a == b); }

    // Instrumentation accessors
    size_t rotation_count() const noexcept { return rotation_count_; }
    void reset_rotation_count() noexcept { rotation_count_ = 0; }

    // validate_invariants_json:
    // Produces structured JSON diagnostics in out_json.
    // Returns true if invariants hold, false otherwise.
    //
    // JSON structure:
    // {
    //   "valid": true|false,
    //   "size_reported": n,
    //   "size_actual": n2,
    //   "height": h,
    //   "rotation_count": r,
    //   "issues": [ "..." , ... ],
    //   "nodes": [
    //       { "key": "...", "height": h, "balance": b, "left": "..."|null, "right": "..."|null, "addr": "0x..." },
    //       ...
    //   ]
    // }
    bool validate_invariants_json(std::string& out_json) const {
        std::vector<std::string> issues;
        size_t counted = 0;

        // returns the recomputed height, or -1 once a violation was recorded below
        std::function<int(const Node*, const Key*, const Key*, size_t)> validate_node;
        validate_node = [&](const Node* node, const Key* min_key, const Key* max_key, size_t depth) -> int {
            if (!node) return 0;
            ++counted;

            if (depth > max_path_length) {
                issues.push_back("Depth exceeds the AVL bound; tree is malformed or cyclic");
                return -1;
            }

            // strict bounds: equal keys may not appear twice
            if (min_key && !comp_(*min_key, node->value.first)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(node->value.first)
                    << " not greater than lower bound " << key_to_string(*min_key);
                issues.push_back(oss.str());
                return -1;
            }
            if (max_key && !comp_(node->value.first, *max_key)) {
                std::ostringstream oss;
                oss << "BST violation: node " << key_to_string(node->value.first)
                    << " not less than upper bound " << key_to_string(*max_key);
                issues.push_back(oss.str());
                return -1;
            }

            int lh = validate_node(node->left, min_key, &node->value.first, depth + 1);
            if (lh < 0) return -1;
            int rh = validate_node(node->right, &node->value.first, max_key, depth + 1);
            if (rh < 0) return -1;

            int expected = 1 + std::max(lh, rh);
            if (node->height != expected) {
                std::ostringstream oss;
                oss << "Height mismatch at key " << key_to_string(node->value.first)
                    << " stored=" << node->height << " actual=" << expected;
                issues.push_back(oss.str());
                return -1;
            }

            int balance = lh - rh;
            if (balance < -1 || balance > 1) {
                std::ostringstream oss;
                oss << "Balance violation at key " << key_to_string(node->value.first)
                    << " left_h=" << lh << " right_h=" << rh;
                issues.push_back(oss.str());
                return -1;
            }
            return expected;
        };

        int tree_height = validate_node(root_, nullptr, nullptr, 0);
        bool valid = tree_height >= 0;

        if (valid && counted != size_) {
            std::ostringstream oss;
            oss << "Size mismatch: size_=" << size_ << " actual=" << counted;
            issues.push_back(oss.str());
            valid = false;
        }

        // Build node list (BFS for deterministic ordering); skipped for malformed trees
        std::vector<std::string> node_jsons;
        if (root_ && tree_height >= 0) {
            std::queue<const Node*> q;
            q.push(root_);
            while (!q.empty()) {
                const Node* n = q.front(); q.pop();
                std::ostringstream nj;
                nj << "{";
                nj << "\"key\":" << json_escape_and_quote(key_to_string(n->value.first)) << ",";
                nj << "\"height\":" << n->height << ",";
                nj << "\"balance\":" << balance_factor(n) << ",";
                if (n->left) nj << "\"left\":" << json_escape_and_quote(key_to_string(n->left->value.first)) << ",";
                else nj << "\"left\":null,";
                if (n->right) nj << "\"right\":" << json_escape_and_quote(key_to_string(n->right->value.first)) << ",";
                else nj << "\"right\":null,";
                nj << "\"addr\":\"" << pointer_to_hex(n) << "\"";
                nj << "}";
                node_jsons.push_back(nj.str());
                if (n->left) q.push(n->left);
                if (n->right) q.push(n->right);
            }
        }

        std::ostringstream out;
        out << "{";
        out << "\"valid\":" << (valid ? "true" : "false") << ",";
        out << "\"size_reported\":" << size_ << ",";
        out << "\"size_actual\":" << counted << ",";
        out << "\"height\":" << tree_height << ",";
        out << "\"rotation_count\":" << rotation_count_ << ",";
        out << "\"issues\":[";
        for (size_t i = 0; i < issues.size(); ++i) {
            out << json_escape_and_quote(issues[i]);
            if (i + 1 < issues.size()) out << ",";
        }
        out << "],";
        out << "\"nodes\":[";
        for (size_t i = 0; i < node_jsons.size(); ++i) {
            out << node_jsons[i];
            if (i + 1 < node_jsons.size()) out << ",";
        }
        out << "]";
        out << "}";
        out_json = out.str();
        return valid && issues.empty();
    }

    // If out is non-null it receives the JSON diagnostics followed by a tree dump.
    bool validate_invariants(std::string* out = nullptr) const {
        std::string json;
        bool ok = validate_invariants_json(json);
        if (!out) return ok;
        std::ostringstream oss;
        oss << "validate_invariants: valid=" << (ok ? "true" : "false") << "\n";
        oss << "JSON diagnostics:\n" << json << "\n";
        oss << "Tree dump:\n";
        oss << tree_dump_to_string(false) << "\n";
        *out = oss.str();
        return ok;
    }

    // Pretty-print tree with indentation. Set show_addresses = true to include node pointer addresses.
    void tree_dump(std::ostream& os, bool show_addresses = false) const {
        os << tree_dump_to_string(show_addresses);
    }

    std::string tree_dump_to_string(bool show_addresses = false) const {
        std::ostringstream oss;
        if (!root_) {
            oss << "<empty tree>\n";
            return oss.str();
        }
        std::function<void(const Node*, std::string)> print_node = [&](const Node* n, std::string indent) {
            if (!n) {
                oss << indent << "(nil)\n";
                return;
            }
            oss << indent << key_to_string(n->value.first)
                << "  h=" << n->height << " bf=" << balance_factor(n);
            if (show_addresses) oss << " @" << pointer_to_hex(n);
            oss << "\n";
            if (!n->left && !n->right) return;
            print_node(n->left, indent + "  L-");
            print_node(n->right, indent + "  R-");
        };
        print_node(root_, "");
        return oss.str();
    }

private:
    Node* root_;
    key_compare comp_;
    NodeAlloc node_alloc_;
    size_type size_;
    size_t rotation_count_;
    size_t stamp_;

    static int node_height(const Node* n) noexcept { return n ? n->height : 0; }

    static int balance_factor(const Node* n) noexcept {
        return n ? node_height(n->left) - node_height(n->right) : 0;
    }

    static void update_height(Node* n) noexcept {
        n->height = 1 + std::max(node_height(n->left), node_height(n->right));
    }

    // rotation helpers (these increment rotation_count_)
    // x's right child y takes x's place; y's old left subtree becomes x's right.
    Node* rotate_left(Node* x) noexcept {
        Node* y = x->right;
        x->right = y->left;
        y->left = x;
        update_height(x);
        update_height(y);
        ++rotation_count_;
        return y;
    }

    Node* rotate_right(Node* y) noexcept {
        Node* x = y->left;
        y->left = x->right;
        x->right = y;
        update_height(y);
        update_height(x);
        ++rotation_count_;
        return x;
    }

    // Refreshes x's height and restores |balance| <= 1 at x. Returns the subtree's new root.
    // A heavier child with balance 0 (only possible after a removal) takes the single rotation.
    Node* rebalance(Node* x) noexcept {
        if (!x) return x;
        update_height(x);
        int bf = balance_factor(x);
        if (bf > 1) {
            if (balance_factor(x->left) < 0) x->left = rotate_left(x->left);
            return rotate_right(x);
        }
        if (bf < -1) {
            if (balance_factor(x->right) > 0) x->right = rotate_right(x->right);
            return rotate_left(x);
        }
        return x;
    }

    // Walks the recorded path bottom-up to the root. Rotations only rewrite the slot being
    // processed, so the slots above it stay valid.
    void retrace(descent_path& path) noexcept {
        for (std::size_t i = path.depth; i-- > 0;) {
            *path.slots[i] = rebalance(*path.slots[i]);
        }
    }

    // Records every slot from the root down to the one holding k (or the nil slot where
    // k would be placed) and returns that last slot.
    Node** descend(const key_type& k, descent_path& path) {
        Node** slot = &root_;
        path.push(slot);
        while (Node* n = *slot) {
            if (comp_(k, n->value.first)) slot = &n->left;
            else if (comp_(n->value.first, k)) slot = &n->right;
            else return slot;
            path.push(slot);
        }
        return slot;
    }

    void link_new_node(Node** slot, Node* z, descent_path& path) {
        *slot = z;
        ++size_;
        ++stamp_;
        retrace(path);
        check_after_mutation();
    }

    // Detaches *slot (the last entry of path) from the tree and rebalances up to the root.
    // The node itself is not freed.
    void unlink_node(Node** slot, descent_path& path) noexcept {
        Node* z = *slot;
        if (!z->left) {
            *slot = z->right;
        } else if (!z->right) {
            *slot = z->left;
        } else {
            // two children: the in-order successor s is relinked into z's position
            std::size_t z_index = path.depth - 1;
            Node** s_slot = &z->right;
            path.push(s_slot);
            while ((*s_slot)->left) {
                s_slot = &(*s_slot)->left;
                path.push(s_slot);
            }
            Node* s = *s_slot;
            *s_slot = s->right;
            s->left = z->left;
            s->right = z->right;
            s->height = z->height;
            *slot = s;
            // the slot below z now lives inside s
            path.slots[z_index + 1] = &s->right;
        }
        --size_;
        ++stamp_;
        retrace(path);
    }

    template <typename V>
    std::pair<iterator, bool> insert_value(V&& val) {
        descent_path path;
        Node** slot = descend(val.first, path);
        if (Node* n = *slot) {
            n->value.second = std::forward<V>(val).second;
            return { find(n->value.first), false };
        }
        Node* z = allocate_node(std::forward<V>(val));
        link_new_node(slot, z, path);
        return { find(z->value.first), true };
    }

    Node* find_node(const key_type& k) const {
        Node* x = root_;
        while (x) {
            if (comp_(k, x->value.first)) x = x->left;
            else if (comp_(x->value.first, k)) x = x->right;
            else return x;
        }
        return nullptr;
    }

    // iterator stack helpers: the top of the stack is the current node, the entries below it
    // are the ancestors whose left subtree is being visited.
    static void push_leftmost(Node* n, std::vector<Node*>& stack) {
        while (n) {
            stack.push_back(n);
            n = n->left;
        }
    }

    static void advance(std::vector<Node*>& stack) {
        Node* n = stack.back();
        stack.pop_back();
        push_leftmost(n->right, stack);
    }

    static bool same_position(const std::vector<Node*>& a, const std::vector<Node*>& b) noexcept {
        if (a.empty() || b.empty()) return a.empty() && b.empty();
        return a.back() == b.back();
    }

    std::vector<Node*> leftmost_stack(Node* n) const {
        std::vector<Node*> stack;
        stack.reserve(height());
        push_leftmost(n, stack);
        return stack;
    }

    std::vector<Node*> find_stack(const key_type& k) const {
        std::vector<Node*> stack;
        Node* x = root_;
        while (x) {
            if (comp_(k, x->value.first)) {
                stack.push_back(x);
                x = x->left;
            } else if (comp_(x->value.first, k)) {
                x = x->right;
            } else {
                stack.push_back(x);
                return stack;
            }
        }
        return std::vector<Node*>();
    }

    // strict == false: first key >= k; strict == true: first key > k.
    std::vector<Node*> bound_stack(const key_type& k, bool strict) const {
        std::vector<Node*> stack;
        stack.reserve(height());
        Node* x = root_;
        while (x) {
            bool keep = strict ? comp_(k, x->value.first) : !comp_(x->value.first, k);
            if (keep) {
                stack.push_back(x);
                x = x->left;
            } else {
                x = x->right;
            }
        }
        return stack;
    }

    // node allocation helpers
    template <typename... Args>
    Node* allocate_node(Args&&... args) {
        Node* n = NodeAllocTraits::allocate(node_alloc_, 1);
        try {
            NodeAllocTraits::construct(node_alloc_, n, std::forward<Args>(args)...);
        } catch (...) {
            NodeAllocTraits::deallocate(node_alloc_, n, 1);
            throw;
        }
        return n;
    }

    void deallocate_node(Node* n) noexcept {
        NodeAllocTraits::destroy(node_alloc_, n);
        NodeAllocTraits::deallocate(node_alloc_, n, 1);
    }

    // Copies the shape of src, heights included; no rebalancing is needed.
    Node* clone_nodes(const Node* src) {
        if (!src) return nullptr;
        Node* n = allocate_node(src->value);
        n->height = src->height;
        try {
            n->left = clone_nodes(src->left);
            n->right = clone_nodes(src->right);
        } catch (...) {
            clear_nodes(n);
            throw;
        }
        return n;
    }

    // clear helper (postorder)
    void clear_nodes(Node* node) noexcept {
        if (!node) return;
        clear_nodes(node->left);
        clear_nodes(node->right);
        deallocate_node(node);
    }

    void steal(AVLTreeMap& other) noexcept {
        root_ = other.root_;
        size_ = other.size_;
        rotation_count_ = other.rotation_count_;
        ++stamp_;
        other.root_ = nullptr;
        other.size_ = 0;
        other.rotation_count_ = 0;
        ++other.stamp_;
    }

    void check_after_mutation() const {
#ifdef AVL_TREE_MAP_VALIDATE_ON_MUTATION
        std::string diag;
        bool ok = validate_invariants_json(diag);
        assert(ok && "AVLTreeMap invariant violation");
        (void)ok;
#endif
    }

    // utility: convert pointer to hex string
    static std::string pointer_to_hex(const void* p) {
        std::ostringstream oss;
        oss << "0x" << std::hex << reinterpret_cast<uintptr_t>(p) << std::dec;
        return oss.str();
    }

    // utility: escape string for JSON and wrap in quotes
    static std::string json_escape_and_quote(const std::string& s) {
        std::ostringstream o;
        o << "\"";
        for (char c : s) {
            switch (c) {
                case '\"': o << "\\\""; break;
                case '\\': o << "\\\\"; break;
                case '\b': o << "\\b"; break;
                case '\f': o << "\\f"; break;
                case '\n': o << "\\n"; break;
                case '\r': o << "\\r"; break;
                case '\t': o << "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        o << "\\u00" << std::hex << (c < 0x10 ? "0" : "") << static_cast<int>(c) << std::dec;
                    } else {
                        o << c;
                    }
            }
        }
        o << "\"";
        return o.str();
    }

    // helper: stream Key into string (requires operator<<)
    template <typename K = Key>
    static std::string key_to_string(const K& k) {
        std::ostringstream oss;
        oss << k;
        return oss.str();
    }
};

template <typename Key, typename T, typename Compare, typename Alloc>
void swap(AVLTreeMap<Key, T, Compare, Alloc>& a, AVLTreeMap<Key, T, Compare, Alloc>& b) {
    a.swap(b);
}

#endif // AVL_TREE_MAP_HPP
