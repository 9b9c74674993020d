#include <cstdlib>
#include <fstream>
#include <iostream>

#include <absl/log/initialize.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

#include "cmdline.h"
#include "phylotree.h"

namespace haplomix {

static auto print_hap_table(const Phylotree& tree, bool leaves_only) -> void {
  for (const auto& [hap_id, variants] : tree.hap_table(leaves_only)) {
    std::cout << hap_id << '\t' << absl::StrJoin(variants, ",", absl::StreamFormatter()) << '\n';
  }
}

static auto print_positions(const Phylotree& tree) -> void {
  for (const auto& site : tree.variant_pos()) {
    std::cout << site + 1 << '\n';  // 0-based to 1-based
  }
}

static auto print_mutation_counts(const Phylotree& tree) -> void {
  for (const auto& [site, counts] : tree.mutation_counts()) {
    std::cout << site + 1;
    for (const auto& [allele, count] : counts) {
      std::cout << absl::StreamFormat("\t%c:%d", allele, count);
    }
    std::cout << '\n';
  }
}

auto cli_main(const Processed_cmd_line& c) -> int {
  auto is = std::ifstream{c.tree_filename};
  if (not is) {
    std::cerr << absl::StreamFormat("ERROR: Could not read phylotree file '%s'\n", c.tree_filename);
    return EXIT_FAILURE;
  }

  auto tree = Phylotree{};
  try {
    tree = read_phylotree_csv(is);
  } catch (const std::runtime_error& e) {
    std::cerr << absl::StreamFormat("ERROR: %s: %s\n", c.tree_filename, e.what());
    return EXIT_FAILURE;
  }
  tree.process_variants(c.rm_unstable, c.rm_backmut);

  std::cerr << absl::StreamFormat("Read %d haplogroups, %d variant sites retained\n",
                                  tree.size(), std::ssize(tree.variant_pos()));

  if (c.dump) { tree.dump(std::cout); }
  if (c.hap_table) { print_hap_table(tree, c.leaves_only); }
  if (c.positions) { print_positions(tree); }
  if (c.mutation_counts) { print_mutation_counts(tree); }

  return EXIT_SUCCESS;
}

}  // namespace haplomix

auto main(int argc, char** argv) -> int {
  using namespace haplomix;

  absl::InitializeLog();

  auto c = process_args(argc, argv);

  return cli_main(c);
}
