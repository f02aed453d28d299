#include "utils/utils.hpp"
#include <gtest/gtest.h>

// --- Tests for utf8_length ---
TEST(UtilsTest, Utf8LengthCountsCodePoints) {
  EXPECT_EQ(Utils::utf8_length(""), 0u);
  EXPECT_EQ(Utils::utf8_length("Batman"), 6u);
  // "Pokémon": the e-acute is two bytes but one character
  EXPECT_EQ(Utils::utf8_length("Pok\xC3\xA9mon"), 7u);
  EXPECT_EQ(std::string("Pok\xC3\xA9mon").size(), 8u);
}

// --- Tests for to_lower_ascii ---
TEST(UtilsTest, ToLowerAsciiLeavesMultibyteUntouched) {
  EXPECT_EQ(Utils::to_lower_ascii("Spider-MAN"), "spider-man");
  EXPECT_EQ(Utils::to_lower_ascii("\xC3\x89T\xC3\x89"), "\xC3\x89t\xC3\x89");
}

// --- Tests for base64_encode ---
TEST(UtilsTest, Base64EncodePadding) {
  EXPECT_EQ(Utils::base64_encode(""), "");
  EXPECT_EQ(Utils::base64_encode("f"), "Zg==");
  EXPECT_EQ(Utils::base64_encode("fo"), "Zm8=");
  EXPECT_EQ(Utils::base64_encode("foo"), "Zm9v");
  EXPECT_EQ(Utils::base64_encode("foobar"), "Zm9vYmFy");
  EXPECT_EQ(Utils::base64_encode("<svg/>"), "PHN2Zy8+");
}

// --- Tests for resident_memory_bytes ---
TEST(UtilsTest, ResidentMemoryIsReportedOnLinux) {
#if defined(__linux__)
  auto resident = Utils::resident_memory_bytes();
  ASSERT_TRUE(resident.has_value());
  EXPECT_GT(*resident, 0u);
#else
  EXPECT_FALSE(Utils::resident_memory_bytes().has_value());
#endif
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_FALSE(Utils::string_to_number<int>("42abc").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());

  auto d = Utils::string_to_number<double>("0.25");
  ASSERT_TRUE(d.has_value());
  EXPECT_DOUBLE_EQ(*d, 0.25);
  EXPECT_FALSE(Utils::string_to_number<double>("0.25x").has_value());
}

TEST(UtilsTest, Trim) {
  EXPECT_EQ(Utils::trim_copy("  spaced out \t"), "spaced out");
  std::string s = "\tkey ";
  Utils::trim_inplace(s);
  EXPECT_EQ(s, "key");
}
