#ifndef HAPLOMIX_VARIANTS_H_
#define HAPLOMIX_VARIANTS_H_

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace haplomix {

using Site_index = int;

// Phylotree variant tokens
// ========================
//
// A variant token describes a single-nucleotide change along a branch of the tree:
//
//   <ancestral allele><1-based position><derived allele>      e.g., "A10G"
//
// with two optional annotations:
//
//   "(C16519T)"   wrapped in parentheses  => unstable site (unreliable marker)
//   "T152C!"      trailing '!' (or "!!")  => back-mutation
//
// Tokens containing '.' (insertions, e.g., "315.1C") or 'd' (deletions, e.g., "A249d") are indels.
// They are not part of the SNP model and are dropped while reading a tree.
//
// Sites are stored 0-based, so "A10G" has site 9.

auto is_snp(std::string_view token) -> bool;
auto is_unstable(std::string_view token) -> bool;
auto is_back_mutation(std::string_view token) -> bool;

// The following throw std::runtime_error if `token` is not a well-formed SNP
auto pos_from_variant(std::string_view token) -> Site_index;
auto derived_allele(std::string_view token) -> char;
auto ancestral_allele(std::string_view token) -> char;

// "(c16519T)" => "C16519T", "T152C!" => "T152C"
auto strip_annotations(std::string_view token) -> std::string;

struct Variant {
  std::string token{};  // As written in the tree, annotations included
  Site_index site{0};
  char from{};
  char to{};
  bool unstable{false};
  bool back_mutation{false};

  auto operator==(const Variant& that) const -> bool = default;
};
inline auto operator<<(std::ostream& os, const Variant& v) -> std::ostream& {
  return os << v.token;
}

auto parse_variant(std::string_view token) -> Variant;

using Variant_list = std::vector<Variant>;

inline auto variant_tokens(const Variant_list& variants) -> std::vector<std::string> {
  auto result = std::vector<std::string>{};
  result.reserve(variants.size());
  for (const auto& v : variants) {
    result.push_back(v.token);
  }
  return result;
}

}  // namespace haplomix

#endif // HAPLOMIX_VARIANTS_H_
