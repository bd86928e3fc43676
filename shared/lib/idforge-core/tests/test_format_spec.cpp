/**
 * @file test_format_spec.cpp
 * @brief Unit tests for layout tokens, display rules and BBAN notation
 */

#include <gtest/gtest.h>
#include "idforge/core/format_spec.h"
#include "exception/exceptions.h"
#include "test_helpers.h"

using namespace idforge::core;
using namespace idforge::core::layout;
using namespace test_helpers;

class FormatSpecTest : public ::testing::Test {
protected:
    std::shared_ptr<const FormatRegistry> registry_ = defaultRegistry();

    const FormatSpec& spec(Category category, const std::string& code) {
        return registry_->lookup(category, code);
    }
};

// ============================================================================
// Display formatting
// ============================================================================

TEST_F(FormatSpecTest, Format_IbanGroupsOfFour) {
    EXPECT_EQ(spec(Category::IBAN, "DE").format("DE89370400440532013000"),
              "DE89 3704 0044 0532 0130 00");
}

TEST_F(FormatSpecTest, Format_PerGapSeparators) {
    EXPECT_EQ(spec(Category::PERSONAL_ID, "BE").format("93051822361"), "93.05.18-223.61");
    EXPECT_EQ(spec(Category::COMPANY_ID, "BR").format("11222333000181"), "11.222.333/0001-81");
}

TEST_F(FormatSpecTest, Format_SingleSeparatorAfterHead) {
    EXPECT_EQ(spec(Category::PERSONAL_ID, "SE").format("8112189876"), "811218-9876");
}

TEST_F(FormatSpecTest, Format_GroupsFromRight) {
    EXPECT_EQ(spec(Category::PERSONAL_ID, "CL").format("123456785"), "12.345.678-5");
    EXPECT_EQ(spec(Category::PERSONAL_ID, "CL").format("12345675"), "1.234.567-5");
}

TEST_F(FormatSpecTest, Format_NoDisplayRuleReturnsRaw) {
    EXPECT_EQ(spec(Category::PERSONAL_ID, "PL").format("44051401359"), "44051401359");
}

TEST_F(FormatSpecTest, Format_RepeatLastGroup) {
    FormatSpec s = makeTestSpec(Category::LEI, "T", {alnum(10)}, groupsOf(4, "-"));
    EXPECT_EQ(s.format("ABCDEFGHIJ"), "ABCD-EFGH-IJ");
}

// ============================================================================
// Normalization
// ============================================================================

TEST_F(FormatSpecTest, Normalize_DropsWhitespaceAndUppercases) {
    EXPECT_EQ(spec(Category::IBAN, "GB").normalize(" gb82 west 1234 5698 7654 32\t"),
              "GB82WEST12345698765432");
}

TEST_F(FormatSpecTest, Normalize_DropsSeparators) {
    EXPECT_EQ(spec(Category::COMPANY_ID, "BR").normalize("11.222.333/0001-81"), "11222333000181");
}

TEST_F(FormatSpecTest, Normalize_DropsStripCharacters) {
    EXPECT_EQ(spec(Category::PERSONAL_ID, "HK").normalize("A123456(3)"), "A1234563");
}

TEST_F(FormatSpecTest, Normalize_KeepsTokenCharacters) {
    // The Finnish century sign is part of the identifier, not a separator
    EXPECT_EQ(spec(Category::PERSONAL_ID, "FI").normalize("131052-308t"), "131052-308T");
}

// ============================================================================
// Tokens
// ============================================================================

TEST_F(FormatSpecTest, Token_Widths) {
    EXPECT_EQ(lit("CHE").width(), 3);
    EXPECT_EQ(digits(7).width(), 7);
    EXPECT_EQ(oneOf({"HRA", "HRB"}).width(), 3);
    EXPECT_EQ(date("YYYYMMDD").width(), 8);
    EXPECT_EQ(century(CenturyCode::NORWEGIAN_INDIVIDUAL).width(), 3);
    EXPECT_EQ(century(CenturyCode::ESTONIAN).width(), 1);
    EXPECT_EQ(sex(SexCoding::LOW_FEMALE, 4).width(), 4);
}

TEST_F(FormatSpecTest, Token_Variable) {
    EXPECT_TRUE(digits(4, 6).isVariable());
    EXPECT_TRUE(optionalChars(kAlnumChars, 3).isVariable());
    EXPECT_FALSE(digits(6).isVariable());
    EXPECT_FALSE(lit("X").isVariable());
}

TEST_F(FormatSpecTest, Token_Charsets) {
    EXPECT_EQ(oneOf({"AB", "BC"}).charset(), "ABC");
    EXPECT_EQ(sex(SexCoding::LETTER_HM).charset(), "HM");
    EXPECT_EQ(century(CenturyCode::SINGAPORE).charset(), "ST");
}

TEST_F(FormatSpecTest, Token_Modifiers) {
    Token t = named(unchecked(prefix("EL")), "country");
    EXPECT_FALSE(t.checked);
    EXPECT_EQ(t.label, "country");
    EXPECT_EQ(pivot(date("YYMMDD"), 1954).date.pivotFrom, 1954);
    EXPECT_EQ(excluding(digits(3), {"000"}).excluded.size(), 1u);
}

TEST_F(FormatSpecTest, Spec_PersonData) {
    EXPECT_TRUE(spec(Category::PERSONAL_ID, "PL").hasPersonData());
    EXPECT_TRUE(spec(Category::PERSONAL_ID, "PL").hasSexCode());
    EXPECT_TRUE(spec(Category::PERSONAL_ID, "LV").hasPersonData());
    EXPECT_FALSE(spec(Category::PERSONAL_ID, "LV").hasSexCode());
    EXPECT_FALSE(spec(Category::IBAN, "DE").hasPersonData());
}

TEST_F(FormatSpecTest, Spec_Key) {
    EXPECT_EQ(spec(Category::SWIFT_BIC, "DE").key(), "swift/DE");
}

// ============================================================================
// BBAN notation
// ============================================================================

TEST_F(FormatSpecTest, ParseBban_Types) {
    auto tokens = parseBban("4!a6!n8!c");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].alphabet, kUpperChars);
    EXPECT_EQ(tokens[0].width(), 4);
    EXPECT_EQ(tokens[1].alphabet, kDigitChars);
    EXPECT_EQ(tokens[1].width(), 6);
    EXPECT_EQ(tokens[2].alphabet, kAlnumChars);
    EXPECT_EQ(tokens[2].width(), 8);
}

TEST_F(FormatSpecTest, ParseBban_MultiDigitLength) {
    auto tokens = parseBban("8!n10!n");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[1].width(), 10);
}

TEST_F(FormatSpecTest, ParseBban_Malformed) {
    EXPECT_THROW(parseBban("n"), common::RegistryException);
    EXPECT_THROW(parseBban("8!"), common::RegistryException);
    EXPECT_THROW(parseBban("8!x"), common::RegistryException);
}
