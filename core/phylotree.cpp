#include "phylotree.h"

#include <stack>
#include <stdexcept>

#include <absl/container/btree_set.h>
#include <absl/container/flat_hash_set.h>
#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

namespace haplomix {

auto Phylotree::add_hap_node(Node_index parent, std::string hap_id, Variant_list variants) -> Node_index {
  if (parent == k_no_node && root != k_no_node) {
    throw std::invalid_argument(absl::StrFormat(
        "Cannot add '%s' as a second root (root is already '%s')", hap_id, at_root().hap_id));
  }

  auto anon = hap_id.empty();
  if (anon && parent != k_no_node) {
    auto k = ++anon_children_so_far_[parent];
    hap_id = absl::StrFormat("%s[%d]", at(parent).hap_id, k);
  }
  if (hap_index_.contains(hap_id)) {
    throw std::invalid_argument(absl::StrFormat("Duplicate haplogroup id '%s'", hap_id));
  }

  auto node = add_node();
  at(node).parent = parent;
  at(node).hap_id = hap_id;
  at(node).anon = anon;
  at(node).variants = std::move(variants);
  if (parent == k_no_node) {
    root = node;
  } else {
    at(parent).children.push_back(node);
  }
  hap_index_.try_emplace(std::move(hap_id), node);
  return node;
}

auto Phylotree::find(std::string_view hap_id) const -> Node_index {
  auto it = hap_index_.find(hap_id);
  return it == hap_index_.end() ? k_no_node : it->second;
}

auto Phylotree::at_hap(std::string_view hap_id) const -> const Hap_node& {
  auto node = find(hap_id);
  if (node == k_no_node) {
    throw std::out_of_range(absl::StrFormat("Unknown haplogroup '%s'", hap_id));
  }
  return at(node);
}

auto Phylotree::haplogroups() const -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  result.reserve(nodes.size());
  for (const auto& node : index_order_traversal(*this)) {
    result.push_back(at(node).hap_id);
  }
  return result;
}

auto Phylotree::all_variants(Node_index node) const -> Variant_list {
  // Walking up from `node`, the first variant seen at a site is the one that sticks
  auto summed_vars = absl::btree_map<Site_index, const Variant*>{};
  for (const auto& ancestor : ancestors_and_self(*this, node)) {
    for (const auto& v : at(ancestor).variants) {
      summed_vars.try_emplace(v.site, &v);
    }
  }

  auto result = Variant_list{};
  result.reserve(summed_vars.size());
  for (const auto& [site, v] : summed_vars) {
    result.push_back(*v);
  }
  return result;
}

auto Phylotree::hap_table(bool leaves_only) const -> Hap_table {
  auto result = Hap_table{};
  for (const auto& node : index_order_traversal(*this)) {
    if (not leaves_only || at(node).is_tip()) {
      result.try_emplace(at(node).hap_id, all_variants(node));
    }
  }
  return result;
}

auto Phylotree::process_variants(bool rm_unstable, bool rm_backmut) -> void {
  auto var_pos = absl::btree_set<Site_index>{};
  auto ignore = absl::flat_hash_set<Site_index>{};
  mutation_counts_.clear();

  for (const auto& node : index_order_traversal(*this)) {
    for (const auto& v : at(node).variants) {
      if (rm_unstable && v.unstable) {
        ignore.insert(v.site);
      } else if (rm_backmut && v.back_mutation) {
        ignore.insert(v.site);
      } else {
        var_pos.insert(v.site);
      }
      ++mutation_counts_[v.site][v.to];
    }
  }

  if (rm_unstable || rm_backmut) {
    for (const auto& site : ignore) {
      var_pos.erase(site);
    }
    for (auto& node : nodes) {
      std::erase_if(node.variants, [&ignore](const Variant& v) { return ignore.contains(v.site); });
    }
  }

  variant_pos_.assign(var_pos.begin(), var_pos.end());
}

auto Phylotree::dump(std::ostream& os) const -> void {
  auto depths = calc_node_depths(*this);
  for (const auto& node : pre_order_traversal(*this)) {
    auto prefix = std::string(2 * depths[node], ' ');
    os << absl::StreamFormat("%sNode: %s\n", prefix, at(node).hap_id);
    os << absl::StreamFormat("%sVariants: %s\n", prefix,
                             absl::StrJoin(at(node).variants, ",", absl::StreamFormatter()));
    os << absl::StreamFormat("%sChildren: %d\n", prefix, std::ssize(at(node).children));
  }
}

auto operator<<(std::ostream& os, const Phylotree& tree) -> std::ostream& {
  for (const auto& node : index_order_traversal(tree)) {
    os << (node == tree.root ? '*' : ' ') << absl::StreamFormat("[%3d] ", node) << tree.at(node) << "\n";
  }
  return os;
}

auto read_phy_line(std::string_view line, int line_num) -> Phy_line {
  std::vector<std::string_view> items = absl::StrSplit(absl::StripTrailingAsciiWhitespace(line), ',');

  auto level = 0;
  while (level < std::ssize(items) && items[level].empty()) {
    ++level;
  }
  if (level == std::ssize(items)) {
    throw std::runtime_error(absl::StrFormat("Line %d: no haplogroup id or variants", line_num));
  }

  // An anonymous node has an empty id, so we first land on its variant list instead.
  // Variant lists (almost always) have spaces in them, haplogroup ids never do.
  while (items[level].find(' ') != std::string_view::npos) {
    --level;
    if (level < 0) {
      throw std::runtime_error(absl::StrFormat(
          "Line %d: could not locate haplogroup id in '%s'", line_num, line));
    }
  }

  auto result = Phy_line{.level = level, .hap_id = std::string{items[level]}, .variant_tokens = {}};
  if (level + 1 < std::ssize(items)) {
    for (auto token : absl::StrSplit(items[level + 1], ' ', absl::SkipEmpty())) {
      result.variant_tokens.emplace_back(token);
    }
  }
  return result;
}

auto read_phylotree_csv(std::istream& is) -> Phylotree {
  struct Open_node {
    Node_index node;
    int level;
  };

  auto tree = Phylotree{};
  auto node_stack = std::stack<Open_node>{};  // Ancestors of the next node, deepest on top
  auto root_level = 0;
  auto line_num = 0;

  for (auto line = std::string{}; std::getline(is, line);) {
    ++line_num;
    auto [level, hap_id, raw_variants] = read_phy_line(line, line_num);

    auto variants = Variant_list{};
    for (const auto& token : raw_variants) {
      if (is_snp(token)) {
        try {
          variants.push_back(parse_variant(token));
        } catch (const std::runtime_error& e) {
          throw std::runtime_error(absl::StrFormat("Line %d: %s", line_num, e.what()));
        }
      }
    }

    while (not node_stack.empty() && node_stack.top().level >= level) {
      node_stack.pop();
    }

    auto parent = k_no_node;
    if (node_stack.empty()) {
      if (tree.root != k_no_node) {
        throw std::runtime_error(absl::StrFormat(
            "Line %d: '%s' at level %d would be a second root (root '%s' is at level %d)",
            line_num, hap_id, level, tree.at_root().hap_id, root_level));
      }
      root_level = level;
    } else {
      if (level != node_stack.top().level + 1) {
        throw std::runtime_error(absl::StrFormat(
            "Line %d: indentation jumps from level %d to level %d",
            line_num, node_stack.top().level, level));
      }
      parent = node_stack.top().node;
    }

    if (not hap_id.empty() && tree.find(hap_id) != k_no_node) {
      throw std::runtime_error(absl::StrFormat("Line %d: duplicate haplogroup id '%s'", line_num, hap_id));
    }
    auto node = k_no_node;
    try {
      node = tree.add_hap_node(parent, std::move(hap_id), std::move(variants));
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(absl::StrFormat("Line %d: %s", line_num, e.what()));
    }
    node_stack.push(Open_node{node, level});
  }

  if (tree.empty()) {
    throw std::runtime_error("Phylotree input has no nodes");
  }

  assert_tree_integrity(tree);
  return tree;
}

}  // namespace haplomix
