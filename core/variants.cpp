#include "variants.h"

#include <algorithm>
#include <stdexcept>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_format.h>

namespace haplomix {

auto is_snp(std::string_view token) -> bool {
  return token.find('.') == std::string_view::npos && token.find('d') == std::string_view::npos;
}

auto is_unstable(std::string_view token) -> bool {
  return token.starts_with('(');
}

auto is_back_mutation(std::string_view token) -> bool {
  return token.find('!') != std::string_view::npos;
}

// Peel off "(...)" and any trailing '!' markers, in whichever order they were written
static auto core_of(std::string_view token) -> std::string_view {
  auto core = token;
  if (core.starts_with('(')) { core.remove_prefix(1); }
  while (not core.empty() && (core.back() == ')' || core.back() == '!')) { core.remove_suffix(1); }
  return core;
}

struct Snp_parts {
  char from;
  Site_index site;
  char to;
};

static auto split_snp(std::string_view token) -> Snp_parts {
  auto core = core_of(token);
  if (core.size() < 3
      || not absl::ascii_isalpha(static_cast<unsigned char>(core.front()))
      || not absl::ascii_isalpha(static_cast<unsigned char>(core.back()))) {
    throw std::runtime_error(absl::StrFormat("Malformed variant '%s'", token));
  }

  auto digits = core.substr(1, core.size() - 2);
  auto one_based_pos = 0;
  if (not std::ranges::all_of(digits, [](char c) { return absl::ascii_isdigit(static_cast<unsigned char>(c)); })
      || not absl::SimpleAtoi(digits, &one_based_pos)
      || one_based_pos < 1) {
    throw std::runtime_error(absl::StrFormat("Malformed position in variant '%s'", token));
  }

  return Snp_parts{
    .from = absl::ascii_toupper(static_cast<unsigned char>(core.front())),
    .site = one_based_pos - 1,  // 1-based to 0-based
    .to = absl::ascii_toupper(static_cast<unsigned char>(core.back()))};
}

auto pos_from_variant(std::string_view token) -> Site_index {
  return split_snp(token).site;
}

auto derived_allele(std::string_view token) -> char {
  return split_snp(token).to;
}

auto ancestral_allele(std::string_view token) -> char {
  return split_snp(token).from;
}

auto strip_annotations(std::string_view token) -> std::string {
  auto core = std::string{core_of(token)};
  absl::AsciiStrToUpper(&core);
  return core;
}

auto parse_variant(std::string_view token) -> Variant {
  auto [from, site, to] = split_snp(token);
  return Variant{
    .token = std::string{token},
    .site = site,
    .from = from,
    .to = to,
    .unstable = is_unstable(token),
    .back_mutation = is_back_mutation(token)};
}

}  // namespace haplomix
