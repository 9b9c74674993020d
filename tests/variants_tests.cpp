#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

#include "variants.h"

namespace haplomix {

TEST(Variants_test, plain_snp) {
  auto v = parse_variant("A10G");

  EXPECT_THAT(v.token, testing::StrEq("A10G"));
  EXPECT_THAT(v.site, testing::Eq(9));
  EXPECT_THAT(v.from, testing::Eq('A'));
  EXPECT_THAT(v.to, testing::Eq('G'));
  EXPECT_FALSE(v.unstable);
  EXPECT_FALSE(v.back_mutation);
}

TEST(Variants_test, unstable_snp) {
  auto v = parse_variant("(C16519T)");

  EXPECT_THAT(v.token, testing::StrEq("(C16519T)"));
  EXPECT_THAT(v.site, testing::Eq(16518));
  EXPECT_THAT(v.from, testing::Eq('C'));
  EXPECT_THAT(v.to, testing::Eq('T'));
  EXPECT_TRUE(v.unstable);
  EXPECT_FALSE(v.back_mutation);
}

TEST(Variants_test, back_mutations) {
  auto v = parse_variant("T152C!");
  EXPECT_THAT(v.site, testing::Eq(151));
  EXPECT_THAT(v.to, testing::Eq('C'));
  EXPECT_TRUE(v.back_mutation);
  EXPECT_FALSE(v.unstable);

  auto vv = parse_variant("G8251A!!");
  EXPECT_THAT(vv.site, testing::Eq(8250));
  EXPECT_THAT(vv.to, testing::Eq('A'));
  EXPECT_TRUE(vv.back_mutation);

  auto both = parse_variant("(T195C!)");
  EXPECT_THAT(both.site, testing::Eq(194));
  EXPECT_TRUE(both.unstable);
  EXPECT_TRUE(both.back_mutation);
}

TEST(Variants_test, lowercase_alleles) {
  EXPECT_THAT(ancestral_allele("a73g"), testing::Eq('A'));
  EXPECT_THAT(derived_allele("a73g"), testing::Eq('G'));
  EXPECT_THAT(pos_from_variant("a73g"), testing::Eq(72));
}

TEST(Variants_test, indels_are_not_snps) {
  EXPECT_TRUE(is_snp("A10G"));
  EXPECT_TRUE(is_snp("(C16519T)"));
  EXPECT_TRUE(is_snp("T152C!"));

  EXPECT_FALSE(is_snp("315.1C"));
  EXPECT_FALSE(is_snp("A249d"));
  EXPECT_FALSE(is_snp("(523.XC)"));
}

TEST(Variants_test, annotations) {
  EXPECT_TRUE(is_unstable("(C16519T)"));
  EXPECT_FALSE(is_unstable("C16519T"));
  EXPECT_TRUE(is_back_mutation("T152C!"));
  EXPECT_FALSE(is_back_mutation("T152C"));

  EXPECT_THAT(strip_annotations("(c16519T)"), testing::StrEq("C16519T"));
  EXPECT_THAT(strip_annotations("T152C!"), testing::StrEq("T152C"));
  EXPECT_THAT(strip_annotations("G8251A!!"), testing::StrEq("G8251A"));
  EXPECT_THAT(strip_annotations("A10G"), testing::StrEq("A10G"));
}

TEST(Variants_test, malformed) {
  EXPECT_THROW(parse_variant(""), std::runtime_error);
  EXPECT_THROW(parse_variant("AG"), std::runtime_error);
  EXPECT_THROW(parse_variant("10G"), std::runtime_error);
  EXPECT_THROW(parse_variant("A10"), std::runtime_error);
  EXPECT_THROW(parse_variant("A1x0G"), std::runtime_error);
  EXPECT_THROW(parse_variant("A0G"), std::runtime_error);
  EXPECT_THROW(parse_variant("A-3G"), std::runtime_error);
  EXPECT_THROW(pos_from_variant("()"), std::runtime_error);
}

TEST(Variants_test, default_variant_is_blank) {
  Variant v;  // default-initialized, not value-initialized

  EXPECT_THAT(v.token, testing::IsEmpty());
  EXPECT_THAT(v.site, testing::Eq(0));
  EXPECT_THAT(v.from, testing::Eq('\0'));
  EXPECT_THAT(v.to, testing::Eq('\0'));
  EXPECT_FALSE(v.unstable);
  EXPECT_FALSE(v.back_mutation);
  EXPECT_THAT(v, testing::Eq(Variant{}));
  EXPECT_THAT(v, testing::Ne(parse_variant("A1G")));
}

TEST(Variants_test, tokens_and_printing) {
  auto variants = Variant_list{parse_variant("A10G"), parse_variant("(C16519T)")};
  EXPECT_THAT(variant_tokens(variants), testing::ElementsAre("A10G", "(C16519T)"));

  auto os = std::ostringstream{};
  os << variants[1];
  EXPECT_THAT(os.str(), testing::StrEq("(C16519T)"));
}

}  // namespace haplomix
