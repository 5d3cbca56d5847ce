#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../common/candidates/normalizer.h"

using namespace candidates::normalize;

TEST(NormalizePhoneTest, StripsFormattingCharacters) {
  EXPECT_EQ(NormalizePhone("+1 (415) 555-0100"), "14155550100");
  EXPECT_EQ(NormalizePhone("0400 000 000"), "0400000000");
}

TEST(NormalizePhoneTest, KeepsDigitOrderAndDropsEverythingElse) {
  const std::string raw = "9a8b7 c-6.5/4";
  const auto digits = NormalizePhone(raw);
  EXPECT_EQ(digits, "987654");
  for (const char ch : digits) {
    EXPECT_TRUE(ch >= '0' && ch <= '9');
  }
}

TEST(NormalizePhoneTest, ReturnsEmptyWhenNoDigits) {
  EXPECT_EQ(NormalizePhone("abc"), "");
  EXPECT_EQ(NormalizePhone(""), "");
}

TEST(NormalizePhoneTest, IgnoresNonAsciiDigits) {
  // U+0663 ARABIC-INDIC DIGIT THREE
  EXPECT_EQ(NormalizePhone("12\xD9\xA3" "4"), "124");
}

TEST(ParseSkillsTest, DeduplicatesCaseInsensitivelyKeepingFirstSpelling) {
  const std::vector<std::string> expected{"Python", "SQL"};
  EXPECT_EQ(ParseSkills("Python, python, SQL"), expected);
}

TEST(ParseSkillsTest, TrimsAndDropsEmptyPieces) {
  const std::vector<std::string> expected{"C++", "Docker", "Go"};
  EXPECT_EQ(ParseSkills("  C++ ,, Docker,\t ,Go , "), expected);
}

TEST(ParseSkillsTest, PreservesOrderOfFirstAppearance) {
  const std::vector<std::string> expected{"sql", "Rust", "FastAPI"};
  EXPECT_EQ(ParseSkills("sql,Rust,SQL,fastapi,FastAPI,rust"),
            (std::vector<std::string>{"sql", "Rust", "fastapi"}));
  EXPECT_EQ(ParseSkills("sql, Rust, FastAPI, RUST"), expected);
}

TEST(ParseSkillsTest, WhitespaceOnlyInputYieldsNothing) {
  EXPECT_TRUE(ParseSkills("").empty());
  EXPECT_TRUE(ParseSkills(" , ,  ").empty());
}

TEST(TextHelpersTest, CountsUtf8CodePoints) {
  EXPECT_EQ(CountCodePoints("Jo"), 2u);
  EXPECT_EQ(CountCodePoints("Zo\xC3\xAB"), 3u);
  EXPECT_EQ(CountCodePoints(""), 0u);
}

TEST(ParseSkillsTest, DeduplicatesNonAsciiSkillsCaseInsensitively) {
  // "Élan, élan, SQL"
  const std::vector<std::string> expected{"\xC3\x89lan", "SQL"};
  EXPECT_EQ(ParseSkills("\xC3\x89lan, \xC3\xA9lan, SQL"), expected);
  // Greek "ΔΕΛΤΑ" and "δέλτα" differ by the accent, so both stay.
  EXPECT_EQ(ParseSkills("\xCE\x94\xCE\x95\xCE\x9B\xCE\xA4\xCE\x91, "
                        "\xCE\xB4\xCE\xAD\xCE\xBB\xCF\x84\xCE\xB1")
                .size(),
            2u);
}

TEST(TextHelpersTest, LowersUnicodeText) {
  EXPECT_EQ(ToLower("PyThOn"), "python");
  EXPECT_EQ(ToLower("\xC3\x89LAN"), "\xC3\xA9lan");
  EXPECT_EQ(ToLower(".PDF"), ".pdf");
  EXPECT_EQ(ToLower(""), "");
}
