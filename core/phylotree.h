#ifndef HAPLOMIX_PHYLOTREE_H_
#define HAPLOMIX_PHYLOTREE_H_

#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include <absl/container/btree_map.h>
#include <absl/container/flat_hash_map.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "tree.h"
#include "variants.h"

namespace haplomix {

// Haplogroup nodes
// ================

struct Hap_node : public Nary_node {
  std::string hap_id;
  bool anon{false};        // true if `hap_id` was generated, i.e., the node has no name in the input
  Variant_list variants;   // Variants on the branch leading to this node, as listed in the input

  auto operator==(const Hap_node& that) const -> bool = default;
};
inline auto operator<<(std::ostream& os, const Hap_node& node) -> std::ostream& {
  return os << absl::StreamFormat(
      "Hap_node{hap_id=\"%s\", variants=[%s], parent=%d, children=[%s]}",
      node.hap_id,
      absl::StrJoin(node.variants, ", ", absl::StreamFormatter()),
      node.parent,
      absl::StrJoin(node.children, ", "));
}

// Site -> derived allele -> number of times a mutation to that allele appears anywhere in the tree
using Mutation_counts = absl::btree_map<Site_index, absl::btree_map<char, int>>;

// Haplogroup id -> all variants that define it (see `Phylotree::all_variants`)
using Hap_table = absl::btree_map<std::string, Variant_list>;

// Phylotrees
// ==========
//
// A Phylotree holds haplogroups and the variants that define them in an explicit tree (modelled on
// the mtDNA tree from phylotree.org).  The general workflow is to read the tree from its CSV rendition
// (`read_phylotree_csv`), filter variant sites by their annotations (`process_variants`) and then hand
// the retained sites (`variant_pos`) and each haplogroup's variants (`all_variants` or `hap_table`)
// to whatever builds the read/haplogroup likelihood matrix.
class Phylotree : public Tree<Hap_node> {
 public:
  Phylotree() = default;

  // Appends a node below `parent` (or makes it the root if `parent == k_no_node`).  An empty `hap_id`
  // makes the node anonymous: it is named "<parent id>[k]" for the k-th anonymous child of `parent`.
  // Throws std::invalid_argument on a duplicate id or a second root.
  auto add_hap_node(Node_index parent, std::string hap_id, Variant_list variants) -> Node_index;

  // Lookup by haplogroup id.  `find` returns k_no_node if absent, `at_hap` throws std::out_of_range
  auto find(std::string_view hap_id) const -> Node_index;
  auto at_hap(std::string_view hap_id) const -> const Hap_node&;

  // Haplogroup ids in input order
  auto haplogroups() const -> std::vector<std::string>;

  // The variants that define the full lineage of `node`, sorted by site, at most one per site.
  // A mutation closer to `node` masks any mutation at the same site further up the tree
  // (e.g., C152T on an ancestor is dropped if T152C occurs further down).
  auto all_variants(Node_index node) const -> Variant_list;

  // Same as `all_variants` for every haplogroup (or only for tips if `leaves_only`)
  auto hap_table(bool leaves_only = false) const -> Hap_table;

  // Excludes, tree-wide, every site where any occurrence of a variant is annotated as unstable
  // (if `rm_unstable`) or as a back-mutation (if `rm_backmut`).  Each node's variant list is filtered
  // in place.  Recomputes `variant_pos()` (sorted retained sites) and `mutation_counts()` (counted for
  // every variant seen, before exclusion).
  auto process_variants(bool rm_unstable, bool rm_backmut) -> void;

  auto variant_pos() const -> const std::vector<Site_index>& { return variant_pos_; }
  auto mutation_counts() const -> const Mutation_counts& { return mutation_counts_; }

  // Indented listing of every node, its variants and its number of children
  auto dump(std::ostream& os) const -> void;

 private:
  std::vector<Site_index> variant_pos_{};
  Mutation_counts mutation_counts_{};
  absl::flat_hash_map<std::string, Node_index> hap_index_{};
  Node_map<int> anon_children_so_far_{};
};

auto operator<<(std::ostream& os, const Phylotree& tree) -> std::ostream&;

// Reading phylotree CSV files
// ===========================
//
// Each line describes one node, in pre-order:
//
//   <level empty fields>,<hap_id>,<space-separated variants>[,...]
//
// e.g.
//
//   L0,,
//   ,L0a'b,C16311T! (T16189C)
//   ,,,A10G G263A
//   ,,L0a,
//
// Here, the third line has an empty id, so the variant list is mistaken for the id at first.
// We detect this by the space inside the "id" (the line is retried one level up), so anonymous nodes
// must have at least two variants.  That line becomes the anonymous node "L0a'b[1]" at level 2.

struct Phy_line {
  int level;
  std::string hap_id;
  std::vector<std::string> variant_tokens;  // indels included; filtered in read_phylotree_csv
};

// Throws std::runtime_error (quoting `line_num`) if `line` is blank or the id can't be located
auto read_phy_line(std::string_view line, int line_num = 0) -> Phy_line;

// Throws std::runtime_error on any malformed input; no partial tree is ever returned
auto read_phylotree_csv(std::istream& is) -> Phylotree;

}  // namespace haplomix

#endif // HAPLOMIX_PHYLOTREE_H_
