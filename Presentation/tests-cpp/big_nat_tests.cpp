#include <gtest/gtest.h>
#include "../../Domain/dhall-lang/big_nat.hpp"
#include <cstdint>
#include <string>

using dhall::BigNat;

static BigNat parse(const char* s){
  BigNat n;
  EXPECT_TRUE(BigNat::parse_dec(s, n)) << s;
  return n;
}

TEST(BigNat, Zero){
  auto z = parse("0");
  EXPECT_TRUE(z.is_zero());
  EXPECT_EQ(z.to_string(), "0");
  EXPECT_EQ(parse("0000"), BigNat());
  EXPECT_TRUE(BigNat(0).is_zero());
}

TEST(BigNat, LeadingZerosAreDropped){
  EXPECT_EQ(parse("000123").to_string(), "123");
}

TEST(BigNat, LimbBoundaries){
  EXPECT_EQ(parse("999999999").to_string(), "999999999");
  EXPECT_EQ(parse("1000000000").to_string(), "1000000000");
  EXPECT_EQ(parse("1000000000000000001").to_string(), "1000000000000000001");
  EXPECT_EQ(BigNat(1000000000).to_string(), "1000000000");
}

TEST(BigNat, ArbitraryLength){
  std::string digits = "98765432109876543210987654321098765432109876543210";
  EXPECT_EQ(parse(digits.c_str()).to_string(), digits);
}

TEST(BigNat, RejectsNonDigits){
  BigNat n;
  EXPECT_FALSE(BigNat::parse_dec("", n));
  EXPECT_FALSE(BigNat::parse_dec("12a", n));
  EXPECT_FALSE(BigNat::parse_dec("+1", n));
  EXPECT_FALSE(BigNat::parse_dec("-1", n));
  EXPECT_TRUE(n.is_zero());
}

TEST(BigNat, Compare){
  EXPECT_LT(parse("99"), parse("100"));
  EXPECT_LT(parse("1000000000"), parse("1000000001"));
  EXPECT_EQ(parse("42").compare(BigNat(42)), 0);
  EXPECT_EQ(parse("123456789012").compare(parse("123456789011")), 1);
  EXPECT_NE(parse("1"), parse("2"));
}

TEST(BigNat, U64Range){
  auto max = parse("18446744073709551615");
  EXPECT_TRUE(max.fits_u64());
  EXPECT_EQ(max.to_u64(), UINT64_MAX);
  EXPECT_EQ(BigNat(UINT64_MAX), max);
  EXPECT_FALSE(parse("18446744073709551616").fits_u64());
  EXPECT_EQ(parse("42").to_u64(), 42u);
}
