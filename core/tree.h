#ifndef HAPLOMIX_TREE_H_
#define HAPLOMIX_TREE_H_

#include <algorithm>
#include <ranges>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/log/check.h"
#include "cppcoro/generator.hpp"

#include "estd.h"

namespace haplomix {

// Rooted trees
// ============

// A tree is a flat vector of nodes, and a node is named by its position in that vector (a `Node_index`).
// Parents and children are stored as indices too, so a tree can be copied or moved wholesale and
// per-node annotations can live outside it in a `Node_vector` or `Node_map`.
//
// Nodes are only ever appended, so a parent is always added before its children and a node's index
// never changes once assigned.
using Node_index = int;

// "No node here", e.g., the parent of the root
inline constexpr Node_index k_no_node = -1;

// One `T` per node, indexed by `Node_index`
template<typename T>
using Node_vector = std::vector<T>;

// A `T` for a handful of nodes
template<typename T>
using Node_map = absl::flat_hash_map<Node_index, T>;

// Topology of a single node.  Payload-carrying nodes (e.g. `Hap_node`) derive from `Nary_node`
// and add their own fields.
template<typename Child_indices>
struct Node {
  Node_index parent{k_no_node};
  Child_indices children{};

  auto is_inner_node() const -> bool { return not children.empty(); }
  auto is_tip() const -> bool { return children.empty(); }

  auto operator==(const Node& that) const -> bool = default;
};
template<typename N>
concept Node_like = requires(N node){
  []<typename C>(const Node<C>&){}(node);  // N derives from Node<C> for some C
};

using Nary_node = Node<std::vector<Node_index>>;

// Nodes plus the index of the root (`k_no_node` while the tree is empty).
// Wiring up `parent`, `children` and `root` is left to the caller; see `Phylotree::add_hap_node`.
template<Node_like Node>
struct Tree {
  Node_index root{k_no_node};
  Node_vector<Node> nodes{};

  auto size() const -> Node_index { return static_cast<Node_index>(std::ssize(nodes)); }
  auto empty() const -> bool { return nodes.empty(); }

  auto at(Node_index i) -> Node& { return nodes.at(i); }
  auto at(Node_index i) const -> const Node& { return nodes.at(i); }

  auto at_root() -> Node& { return at(root); }
  auto at_root() const -> const Node& { return at(root); }

  // Appends `node` unconnected and returns its index
  auto add_node(Node&& node = {}) -> Node_index {
    auto new_node = size();
    nodes.push_back(std::move(node));
    return new_node;
  }
};
template<typename T>
concept Tree_like = requires(T tree){
  []<typename N>(const Tree<N>&){}(tree);  // T derives from Tree<N> for some N
};


// Walks
// =====

// Parents before children, children in the order they were listed.  Haplogroup trees run to thousands
// of levels in degenerate inputs, so the walk keeps its own stack instead of recursing.
auto pre_order_traversal(const Tree_like auto& tree) -> cppcoro::generator<Node_index> {
  if (tree.empty()) { co_return; }

  auto pending = std::vector<Node_index>{tree.root};
  while (not pending.empty()) {
    auto node = pending.back();
    pending.pop_back();
    co_yield Node_index{node};

    const auto& children = tree.at(node).children;
    pending.insert(pending.end(), children.rbegin(), children.rend());
  }
}

// Order of insertion, which for trees built top-down puts every parent before its children
auto index_order_traversal(const Tree_like auto& tree) {
  return std::views::iota(Node_index{0}, tree.size());
}

// `node`, its parent, its grandparent, ..., the root
auto ancestors_and_self(const Tree_like auto& tree, Node_index node) -> cppcoro::generator<Node_index> {
  for (; node != k_no_node; node = tree.at(node).parent) {
    co_yield Node_index{node};
  }
}

// depths[i] = number of branches between node i and the root
auto calc_node_depths(const Tree_like auto& tree) -> Node_vector<int> {
  auto depths = Node_vector<int>(tree.size(), 0);
  for (const auto& node : pre_order_traversal(tree)) {
    if (auto parent = tree.at(node).parent; parent != k_no_node) {
      depths[node] = depths[parent] + 1;
    }
  }
  return depths;
}


// Consistency checks
// ==================
// No-ops in release builds unless `force` is set.  Failures abort via CHECK.

inline auto assert_node_integrity(const Tree_like auto& tree, Node_index node, bool force = false) -> void {
  if (not (estd::is_debug_enabled || force)) { return; }

  if (auto parent = tree.at(node).parent; parent != k_no_node) {
    CHECK_GE(parent, 0);
    CHECK_LT(parent, tree.size());
    CHECK_EQ(std::ranges::count(tree.at(parent).children, node), 1) << "node " << node;
  }
  for (const auto& child : tree.at(node).children) {
    CHECK_GE(child, 0);
    CHECK_LT(child, tree.size());
    CHECK_EQ(tree.at(child).parent, node) << "child " << child;
  }
}

// Every node is reachable from the root exactly once, and parent/child links agree
inline auto assert_tree_integrity(const Tree_like auto& tree, bool force = false) -> void {
  if (not (estd::is_debug_enabled || force)) { return; }

  if (tree.empty()) {
    CHECK_EQ(tree.root, k_no_node);
    return;
  }
  CHECK_GE(tree.root, 0);
  CHECK_LT(tree.root, tree.size());
  CHECK_EQ(tree.at_root().parent, k_no_node);

  auto num_visited = 0;
  auto visited = Node_vector<bool>(tree.size(), false);
  for (const auto& node : pre_order_traversal(tree)) {
    CHECK(not visited[node]) << "node " << node << " reached twice";
    visited[node] = true;
    ++num_visited;
    assert_node_integrity(tree, node, force);
  }
  CHECK_EQ(num_visited, tree.size()) << "nodes unreachable from the root";
}

}  // namespace haplomix

#endif // HAPLOMIX_TREE_H_
